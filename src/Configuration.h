#pragma once

#include <algorithm>
#include <c4/yml/std/string.hpp>
#include <c4/yml/tree.hpp>
#include <cmath>
#include <cstring>
#include <fstream>
#include <memory>
#include <ryml.hpp>
#include <ryml_std.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class Configuration
 * @brief Read-only navigation of a YAML document using RapidYAML.
 *
 * The parse buffer is owned through a shared pointer so that child nodes stay
 * valid for as long as any Configuration referencing the tree is alive.
 */
class Configuration {
public:
    /**
     * @brief Parse a YAML file.
     * @throws std::runtime_error if the file cannot be opened or parsed.
     */
    static Configuration from_file(const std::string& file_path) {
        std::ifstream ifs(file_path);
        if(!ifs.is_open()) {
            throw std::runtime_error("Could not open YAML file: " + file_path);
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return from_string(buffer.str());
    }

    /**
     * @brief Parse YAML content held in a string.
     * @note Uses parse_in_place on an owned copy of the content.
     * @example
     *   auto config = Configuration::from_string("hedge:\n  offset_cents: 2\n");
     *   int offset = config.child("hedge").get<int>("offset_cents");
     */
    static Configuration from_string(const std::string& yaml_content) {
        auto tree = std::make_shared<ryml::Tree>();
        auto buffer = std::make_shared<std::vector<char>>(yaml_content.size() + 1);
        std::memcpy(buffer->data(), yaml_content.data(), yaml_content.size());
        (*buffer)[yaml_content.size()] = '\0';

        ryml::parse_in_place(ryml::to_substr(buffer->data()), tree.get());
        const ryml::NodeRef root = tree->rootref();
        return Configuration(std::move(tree), root, std::move(buffer));
    }

    Configuration() = default;

    [[nodiscard]]
    bool is_valid() const {
        return (tree_ != nullptr) && node_.valid();
    }

    [[nodiscard]]
    bool is_map() const {
        return is_valid() && node_.is_map();
    }

    [[nodiscard]]
    bool is_seq() const {
        return is_valid() && node_.is_seq();
    }

    [[nodiscard]]
    bool has_key(const std::string& key) const {
        return is_valid() && node_.is_map() && node_.has_child(ryml::to_csubstr(key));
    }

    [[nodiscard]]
    size_t num_children() const {
        return is_valid() ? node_.num_children() : 0;
    }

    /**
     * @brief Access a child node by key in a map node.
     * @throws std::runtime_error if the node is invalid, not a map, or lacks the key.
     */
    [[nodiscard]]
    Configuration child(const std::string& key) const {
        if(!is_valid()) {
            throw std::runtime_error("Cannot access key '" + key + "' from invalid node");
        }
        if(!node_.is_map()) {
            throw std::runtime_error("Cannot access key '" + key + "' from non-map node");
        }
        if(!node_.has_child(ryml::to_csubstr(key))) {
            throw std::runtime_error("Key '" + key + "' not found in map");
        }
        return Configuration(tree_, node_[ryml::to_csubstr(key)], buffer_);
    }

    /**
     * @brief Access a child node by index in a sequence node.
     * @throws std::runtime_error if the node is invalid, not a sequence, or the index is out of range.
     */
    [[nodiscard]]
    Configuration child(size_t index) const {
        if(!is_valid()) {
            throw std::runtime_error("Cannot access index " + std::to_string(index) + " from invalid node");
        }
        if(!node_.is_seq()) {
            throw std::runtime_error("Cannot access index " + std::to_string(index) + " from non-sequence node");
        }
        if(index >= node_.num_children()) {
            throw std::runtime_error("Index " + std::to_string(index) + " out of range, sequence size is " +
                                     std::to_string(node_.num_children()));
        }
        return Configuration(tree_, node_.child(index), buffer_);
    }

    /**
     * @brief Convert a scalar node to T.
     * @tparam T std::string, bool ("true"/"false", "yes"/"no", "1"/"0"), an integral or a floating point type.
     * @throws std::runtime_error naming the node's key if the value is null, empty or not convertible.
     */
    template<typename T>
    T as() const {
        if(!is_valid()) {
            throw std::runtime_error("Invalid node");
        }
        if(!node_.has_val()) {
            throw std::runtime_error("Node '" + key_name() + "' has no value");
        }

        std::string str_val;
        node_ >> str_val;

        if(str_val.empty() || str_val == "null" || str_val == "Null" || str_val == "NULL" || str_val == "~") {
            throw std::runtime_error("Value for node '" + key_name() + "' is null or empty");
        }

        if constexpr(std::is_same_v<T, std::string>) {
            return str_val;
        } else if constexpr(std::is_same_v<T, bool>) {
            std::transform(str_val.begin(), str_val.end(), str_val.begin(), ::tolower);
            if(str_val == "true" || str_val == "yes" || str_val == "1") return true;
            if(str_val == "false" || str_val == "no" || str_val == "0") return false;
            throw std::runtime_error("Invalid boolean value for node '" + key_name() + "': '" + str_val + "'");
        } else if constexpr(std::is_integral_v<T>) {
            // Parsed as double first so that scientific notation is accepted
            const double double_val = parse_number(str_val);
            if(double_val != std::floor(double_val)) {
                throw std::runtime_error("Value for node '" + key_name() + "' must be an integer, got: '" + str_val +
                                         "'");
            }
            return static_cast<T>(double_val);
        } else if constexpr(std::is_floating_point_v<T>) {
            return static_cast<T>(parse_number(str_val));
        } else {
            static_assert(sizeof(T) == 0, "Unsupported configuration value type");
        }
    }

    /**
     * @brief Strict lookup of a child scalar.
     * @throws std::runtime_error if the key is missing or the value cannot be converted.
     */
    template<typename T>
    [[nodiscard]] T get(const std::string& key) const {
        return child(key).as<T>();
    }

    /**
     * @brief Lookup of an optional child scalar.
     * @return default_value when the key is absent or has an empty value. A value
     *         that is present but malformed still throws.
     */
    template<typename T>
    [[nodiscard]] T get(const std::string& key, const T& default_value) const {
        if(!has_key(key)) {
            return default_value;
        }
        auto child_node = node_[ryml::to_csubstr(key)];
        if(!child_node.has_val() || child_node.val().empty()) {
            return default_value;
        }
        return Configuration(tree_, child_node, buffer_).as<T>();
    }

    /**
     * @brief Invoke func(const Configuration&) for every value of a map or element of a sequence.
     */
    template<typename Func>
    void for_each_child(Func func) const {
        if(!is_map() && !is_seq()) {
            return;
        }
        for(const ryml::NodeRef ch : node_.children()) {
            func(Configuration(tree_, ch, buffer_));
        }
    }

    /**
     * @brief The whole document on a single line, for the startup log.
     */
    std::string dump_compact() const {
        if(!is_valid()) {
            return "{invalid}";
        }
        return compact_yaml_string(c4::yml::emitrs<std::string>(*tree_));
    }

private:
    static std::string compact_yaml_string(const std::string& yaml) {
        std::string compact;
        bool space_needed = false;

        for(char c : yaml) {
            if(c == '\n') {
                if(!compact.empty() && compact.back() != ' ') {
                    space_needed = true;
                }
                continue;
            }
            if(c != ' ') {
                if(space_needed) {
                    compact += ' ';
                    space_needed = false;
                }
                compact += c;
            } else if(!compact.empty() && compact.back() != ' ') {
                compact += ' ';
            }
        }

        return compact;
    }

    double parse_number(const std::string& str_val) const {
        size_t pos = 0;
        double value = 0.0;
        try {
            value = std::stod(str_val, &pos);
        } catch(const std::logic_error&) {
            pos = 0;
        }
        if(pos == 0 || pos != str_val.length()) {
            throw std::runtime_error("Invalid number format for node '" + key_name() + "': '" + str_val + "'");
        }
        return value;
    }

    std::string key_name() const {
        return node_.has_key() ? std::string(node_.key().data(), node_.key().size()) : "<no key>";
    }

    Configuration(std::shared_ptr<ryml::Tree> tree, ryml::NodeRef node, std::shared_ptr<std::vector<char>> buffer)
        : tree_(std::move(tree))
        , node_(node)
        , buffer_(std::move(buffer)) {}

    std::shared_ptr<ryml::Tree> tree_;
    ryml::NodeRef node_;
    std::shared_ptr<std::vector<char>> buffer_;
};
