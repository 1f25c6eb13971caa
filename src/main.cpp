#include "camera/camera_frame_source.hpp"
#include "communication/control_service.hpp"
#include "communication/impact_queue.hpp"
#include "config/config.hpp"
#include "session/session_manager.hpp"
#include "session/session_store.hpp"
#include "utils/args.hpp"
#include "utils/cache.hpp"
#include "utils/debug.hpp"
#include "utils/host.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  // Configuration: defaults <- file <- command line
  Config config;
  string error;
  string config_path = getArg(argc, argv, "--config", "");
  if (!config_path.empty() && !config::loadFromFile(config_path, config, error))
  {
    log_error("Invalid configuration: " + error);
    return 1;
  }
  if (!config::applyArgs(argc, argv, config, error))
  {
    log_error("Invalid arguments: " + error);
    return 1;
  }

  // set log level based on configuration and debug mode
  logging::LogLevel level = logging::LogLevel::INFO;
  if (!logging::parseLogLevel(config.logging.level, level))
  {
    log_warning("Unknown log level '" + config.logging.level + "', using info");
  }
  logging::setLogLevel(level);
  if (config.logging.to_file)
  {
    logging::setFileLogging(true, config.logging.file,
                            static_cast<uintmax_t>(config.logging.max_file_kb) * 1024, config.logging.backup_count);
  }
  if (config.debug)
  {
    log_info("Debug mode enabled - showing all log messages");
  }

  // Print startup and configuration information
  debug::printStartup("OpenArchery", version);
  debug::printConfig(config);
  log_debug("Effective configuration:\n" + config::dump(config));

  auto events = make_shared<ImpactQueue>(config.service.event_queue_capacity);
  auto store = make_shared<SessionStore>(config.store);

  SessionManager manager(config, make_unique<CameraFrameSource>(config.camera), store, events);

  if (config.session.reuse_calibration)
  {
    CalibrationProfile profile;
    if (!cache::calibration::load(config.session.calibration_cache, profile) || !manager.restoreCalibration(profile))
    {
      log_warning("No usable cached calibration, calibrate before starting a session");
    }
  }

  // Register signal handlers, the main loop routes them to shutdown
  signals::setupSignalHandlers();

  if (!manager.start())
  {
    log_warning("Camera is not available, waiting for a calibrate command to retry");
  }

  ControlService service(manager, store, events, config.service);
  if (!service.start())
  {
    log_error("No control surface, stopping");
    manager.shutdown();
    return 1;
  }

  // Wait for a shutdown command or a signal
  bool by_signal = false;
  while (!manager.waitForShutdown(200))
  {
    signals::dispatchPending([&manager, &by_signal](int)
                             {
      by_signal = true;
      manager.shutdown(); });
  }

  // Stopping the server lets the reply to a shutdown command reach the browser first
  service.stop();
  log_info("OpenArchery stopped");

  // Power the host down once everything is released, only on an operator command
  if (config.host.poweroff_on_shutdown && !by_signal)
  {
    if (!host::powerOff(config.host.poweroff_command))
      return 1;
  }
  return 0;
}
