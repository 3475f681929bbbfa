#pragma once

// English string table - included by i18n.hpp after Strings is defined

inline constexpr Strings EN_STRINGS_DEF = {
    // General
    "Phantom Tunnel Manager",
    "Status: ",
    "Service: ",
    "Installed",
    "Not Installed",
    "Running",
    "Stopped",

    // Menu
    "Install or Update Phantom Tunnel",
    "Uninstall Phantom Tunnel",
    "Restart Service",
    "Stop Service",
    "View Service Status",
    "View Live Logs",
    "Exit",
    "Please enter your choice [1-7]: ",
    "Invalid option. Please try again.",
    "Press any key to return to the menu...",
    "Exiting.",

    // Install: dependencies
    "Starting Phantom Tunnel Installation/Update...",
    "Checking for dependencies: ",
    "Dependencies are satisfied.",
    "Unsupported package manager. Assuming these are installed: ",
    "No supported package manager and missing required tools: ",
    "Dependency installation failed: ",

    // Install: release
    "Unsupported architecture: ",
    "Fetching the latest version from GitHub...",
    "Failed to fetch the latest release tag from GitHub.",
    "Latest version is ",
    "Downloading the latest binary: ",
    "Download failed. Please check the URL and your connection.",
    "Binary downloaded successfully.",
    "Could not create a temporary download directory.",

    // Install: files and unit
    "An existing Phantom service is running. It will be stopped for the update.",
    "Installing executable to ",
    "Failed to install executable: ",
    "Phantom binary installed/updated.",
    "Configuring systemd service...",
    "Failed to write service file: ",
    "Systemd service file created/updated.",

    // Install: first-run setup
    "First-time setup: Please provide initial configuration.",
    "Enter the port for the web panel (e.g., 8080): ",
    "Invalid port number. Installation aborted.",
    "Enter the admin username for the panel [default: ",
    "Enter the admin password for the panel [default: ",
    "Running initial setup to configure the database...",
    "Initial setup failed with exit code ",
    "Existing configuration found, skipping initial setup questions.",

    // Install: start
    "Enabling and starting the Phantom service...",
    "Service has been enabled and started.",
    "Installation/Update complete!",
    "Phantom Tunnel is now RUNNING!",
    "The service failed to start. Please check logs with: journalctl -u ",

    // Uninstall
    "Uninstalling Phantom Tunnel Completely",
    "WARNING: This will remove the binary, all configuration files, databases, and the systemd service. This cannot be undone.",
    "Are you sure you want to continue? [y/N]: ",
    "Uninstallation cancelled.",
    "Stopping and disabling the Phantom service...",
    "Service stopped.",
    "Service disabled.",
    "Phantom service not found. Skipping.",
    "Killing any remaining 'phantom' processes...",
    "Removing systemd service file...",
    "Systemd daemon reloaded.",
    "Removing executable: ",
    "Removing data directory and all its contents: ",
    "Searching for and removing legacy files from ",
    "  - Removing legacy file: ",
    "Cleaning up temporary files...",
    "Failed to remove ",
    "Phantom Tunnel has been completely uninstalled from your system.",
    "If you installed the executable in a non-standard path, please remove it manually.",

    // Service management
    "Phantom Tunnel is not installed. Please install it first.",
    "Restarting Phantom service...",
    "Service restarted.",
    "Stopping Phantom service...",
    "Showing status for Phantom service...",
    "Displaying live logs... (Press Ctrl+C to exit)",

    // Errors
    "Command failed: ",
    "Invalid service name: ",
    "This program must be run as root. Please use 'sudo phantom-manager'.",
};
