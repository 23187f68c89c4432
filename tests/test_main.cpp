#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include <csignal>

int main(int argc, char** argv) {
  // Sessions write to sockets the test clients have already closed
  signal(SIGPIPE, SIG_IGN);

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  return context.run();
}
