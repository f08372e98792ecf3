#include <cpptrace/cpptrace.hpp>

#include <iostream>
#include <string>
#include <vector>

#include "kizuna_app.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    std::vector<std::string> args;
    for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    KizunaApp app(std::cin, std::cout, std::cerr);
    return app.run(args);
  } catch(std::exception& e) {
    init(false);
    log_error(component_logger("main").get(), "Unhandled exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
