#include <csignal>
#include <iostream>

void run_engine_benchmarks();
void run_session_benchmarks();

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  std::cout << "sos Benchmarks\n";
  run_engine_benchmarks();
  run_session_benchmarks();
  return 0;
}
