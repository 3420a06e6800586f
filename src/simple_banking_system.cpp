#include <iostream>
#include <stdexcept>
#include <string>

#include "bank.hpp"
#include "config.hpp"
#include "database.hpp"
#include "generator.hpp"
#include "menu.hpp"

#define PROJECT_NAME "simple-banking-system"

int
main(int argc, char **argv) {
    const std::string configPath = argc > 1 ? argv[1] : config::DEFAULT_PATH;

    auto loaded = config::load(configPath);

    if (!loaded.has_value()) {
      std::cerr << "[LOG] " << PROJECT_NAME << ": can't use configuration " << configPath << std::endl;
      return 1;
    }

    const auto &config = *loaded;

    try {
      database::initSchema(config.store);

      bank::Bank bank{config.store, generator::Generator{config.issuerPrefix}};
      menu::Menu menu{bank, std::cin, std::cout};

      return menu.run();
    } catch (const database::StorageUnavailable &e) {
      std::cerr << "[LOG:STORAGE] " << e.what() << std::endl;
      return 1;
    }
}
