#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

/**
 * @brief Custom exception class for ArgumentParser errors
 */
class ArgumentParserError : public std::runtime_error {
public:
    explicit ArgumentParserError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Command line of the hedgeguard binary
 *
 * Usage: hedgeguard <infra_config.json> [--check]
 *
 * With --check the configuration files are loaded and validated and the
 * process exits without connecting to the market.
 */
class ArgumentParser {
public:
    /**
     * @brief Constructs and validates an ArgumentParser
     *
     * @param argc Number of command-line arguments
     * @param argv Array of command-line arguments
     * @throws ArgumentParserError if:
     *         - the config path is missing or more than one flag is given
     *         - an unknown flag is given
     *         - the config file doesn't exist, is not a regular file or is not readable
     */
    ArgumentParser(int argc, char** argv) {
        if(argc < 2 || argc > 3) {
            throw ArgumentParserError("Usage: hedgeguard <infra_config.json> [--check], got " +
                                      std::to_string(argc - 1) + " arguments");
        }
        if(argc == 3) {
            const std::string flag = argv[2];
            if(flag != "--check") {
                throw ArgumentParserError("Unknown flag: " + flag);
            }
            check_only_ = true;
        }

        try {
            config_path_ = std::filesystem::absolute(std::filesystem::path(argv[1]));
        } catch(const std::filesystem::filesystem_error& e) {
            throw ArgumentParserError(std::string("Invalid path format: ") + e.what());
        }

        validate_config_path();
    }

    /**
     * @brief Gets the validated config file path
     * @return const std::filesystem::path& Absolute path to the infra config file
     */
    [[nodiscard]] const std::filesystem::path& get_config_path() const { return config_path_; }

    [[nodiscard]] bool check_only() const { return check_only_; }

private:
    std::filesystem::path config_path_;
    bool check_only_ = false;

    void validate_config_path() const {
        if(!std::filesystem::exists(config_path_)) {
            throw ArgumentParserError("Config file does not exist: " + config_path_.string());
        }

        if(!std::filesystem::is_regular_file(config_path_)) {
            throw ArgumentParserError("Path is not a regular file: " + config_path_.string());
        }

        const std::ifstream file(config_path_);
        if(!file.good()) {
            throw ArgumentParserError("Config file is not readable: " + config_path_.string());
        }
    }
};
