#include <iostream>

#include "wlm/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    wlm::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return wlm::exitCodeFor(wlm::makeError(wlm::ErrorCode::kUnknownError, e.what()));
  }
}
