#include "./demo/DemoConfig.h"
#include "./demo/Runner.h"
#include "./demo/Viewer.h"
#include "./infer/Backends.h"
#include "./infer/DBDetector.h"
#include "ylt/easylog.hpp"
#include <exception>

int main(int argc, char **argv) {
  easylog::init_log(easylog::Severity::INFO);

  auto caps = db_text::queryBackendCapabilities();
  auto config = db_text::parseDemoConfig(argc, argv, caps);
  if (!config) {
    if (config.error().help_requested) {
      return 0;
    }
    ELOGFMT(ERROR, "Usage error: {}", config.error().message);
    return 1;
  }

  try {
    db_text::DBDetector detector(config->detectorOptions());
    db_text::HighGuiViewer viewer;
    db_text::Runner runner(*config, detector, viewer);
    runner.run();
  } catch (const std::exception &e) {
    ELOGFMT(ERROR, "{}", e.what());
    return 1;
  }

  return 0;
}
