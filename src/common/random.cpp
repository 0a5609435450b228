#include "sos/common/random.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sos::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

void append_hex(std::ostringstream &stream, const unsigned char *data, const std::size_t size) {
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  append_hex(stream, data.data(), data.size());
  return stream.str();
}

std::string uuid_v4() {
  std::array<unsigned char, 16> data{};
  fill_random(data.data(), data.size());
  data[6] = static_cast<unsigned char>((data[6] & 0x0F) | 0x40);
  data[8] = static_cast<unsigned char>((data[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  append_hex(stream, data.data(), 4);
  stream << '-';
  append_hex(stream, data.data() + 4, 2);
  stream << '-';
  append_hex(stream, data.data() + 6, 2);
  stream << '-';
  append_hex(stream, data.data() + 8, 2);
  stream << '-';
  append_hex(stream, data.data() + 10, 6);
  return stream.str();
}

} // namespace sos::common
