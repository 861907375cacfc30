#include "app.hpp"

#include <csignal>

namespace {

ghv::CancellationToken *g_cancel = nullptr;

void handle_interrupt(int) {
  if (g_cancel != nullptr) {
    g_cancel->cancel();
  }
}

} // namespace

/**
 * Program entry point. SIGINT and SIGTERM cancel running backups
 * cooperatively: pipelines finish their current step and abort.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  ghv::App app;
  g_cancel = &app.cancellation();
  std::signal(SIGINT, handle_interrupt);
  std::signal(SIGTERM, handle_interrupt);
  int ret = app.run(argc, argv);
  g_cancel = nullptr;
  return ret;
}
