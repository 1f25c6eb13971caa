#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include "logging.hpp"
#include "config/config.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const Config &config)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Camera: " << config.camera.device << "\n";
        std::cout << "  - Resolution: " << config.camera.width << "x" << config.camera.height << "\n";
        std::cout << "  - FPS: " << config.camera.fps << "\n";
        std::cout << "  - Rotation: " << config.camera.rotation << "\n";
        std::cout << "  - Target: " << config.session.default_target << "\n";
        std::cout << "  - Sessions: " << config.store.directory << " (keep " << config.store.max_sessions << ")\n";
        std::cout << "  - Control: http://" << config.service.host << ":" << config.service.port << "/\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "OpenArchery runtime version: " << version << std::endl;
        std::exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: openarchery [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --config <path>       JSON configuration file (command line flags override it)\n";
        std::cout << "  --camera <device>     V4L2 device, camera index or video file (default: /dev/video0)\n";
        std::cout << "  --width <width>       Frame width (default: 1920)\n";
        std::cout << "  --height <height>     Frame height (default: 1080)\n";
        std::cout << "  --fps <fps>           Frames per second (default: 10)\n";
        std::cout << "  --rotation <deg>      Rotate frames by 0, 90, 180 or 270 degrees (default: 0)\n";
        std::cout << "  --port <port>         Control service port (default: 13520)\n";
        std::cout << "  --sessions <dir>      Session directory (default: sessions)\n";
        std::cout << "  --target <size>       Default target size: 80cm or 122cm (default: 122cm)\n";
        std::cout << "  --reuse-calibration   Restore the cached calibration at start-up when still valid\n";
        std::cout << "  --poweroff            Power the device down after a shutdown command\n";
        std::cout << "  --debug, -d           Enable debug mode (saves frames to debug_frames/ directory)\n";
        std::cout << "  --quiet, -q           Quiet mode (only show errors)\n";
        std::cout << "  --version             Show version information\n";
        std::cout << "  --help                Show this help message\n";
        std::exit(0);
    }

} // namespace debug
