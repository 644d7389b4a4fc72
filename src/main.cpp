#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>

#include "SyncCLI.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"

int main(int argc, char** argv){
  CommandLineParser parser((argc > 0 && argv && argv[0])
                             ? std::filesystem::path(argv[0]).filename().string()
                             : "lansyncd");
  try {
    auto settings = std::make_shared<SettingsManager>();

    // First pass finds data_dir; the command line is applied again after the
    // settings file so it wins over stored values.
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }
    settings->load();
    parser.parse(argc, argv, *settings);

    SyncEngine engine(settings);
    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        log_error(logger, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    auto id = engine.identity();
    print_out(logger, "{} ({})", id.display_name, id.device_id);
    print_out(logger, "certificate fingerprint {}", id.certificate_fingerprint);

    SyncCLI cli(engine, settings);
    cli.run();
    engine.stop();
    return 0;
  } catch(const std::invalid_argument& e) {
    init(false);
    log_error(nullptr, "{}", e.what());
    parser.usage();
    return 2;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("lansyncd");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
