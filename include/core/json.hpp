#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace querygate {

/**
 * @brief Read-only view over a glz::json_t document
 *
 * The parsed document is owned by a shared root; every JsonValue obtained
 * through operator[] or iteration is a (root, node) pair, so walking a
 * libpg_query parse tree never copies subtrees.
 *
 * Missing keys and out-of-range indices yield a null view.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return !node_ || node_->is_null(); }
    [[nodiscard]] bool is_object() const { return node_ && node_->is_object(); }
    [[nodiscard]] bool is_array() const { return node_ && node_->is_array(); }
    [[nodiscard]] bool is_string() const { return node_ && node_->is_string(); }
    [[nodiscard]] bool is_number() const { return node_ && node_->is_number(); }
    [[nodiscard]] bool is_boolean() const { return node_ && node_->is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!is_number()) return false;
        const double d = node_->get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (is_array()) return node_->get_array().size();
        if (is_object()) return node_->get_object().size();
        return 0;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!is_object()) return false;
        const auto& obj = node_->get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!is_object()) return {};
        const auto& obj = node_->get_object();
        const auto it = obj.find(std::string(key));
        if (it == obj.end()) return {};
        return JsonValue(root_, &it->second);
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!is_array()) return {};
        const auto& arr = node_->get_array();
        if (idx >= arr.size()) return {};
        return JsonValue(root_, &arr[idx]);
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return node_->get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return node_->get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return node_->get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(node_->get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // String member or std::nullopt (absent or not a string)
    [[nodiscard]] std::optional<std::string> string_at(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (!v.is_string()) return std::nullopt;
        return v.get<std::string>();
    }

    // Boolean member; libpg_query omits false booleans
    [[nodiscard]] bool flag(std::string_view key) const {
        const JsonValue v = (*this)[key];
        return v.is_boolean() && v.get<bool>();
    }

    // ===== Iteration =====

    /// Array elements in order
    template <typename Fn>
    void for_each_element(Fn&& fn) const {
        if (!is_array()) return;
        for (const auto& elem : node_->get_array()) {
            fn(JsonValue(root_, &elem));
        }
    }

    /// Object members (key, value)
    template <typename Fn>
    void for_each_member(Fn&& fn) const {
        if (!is_object()) return;
        for (const auto& [key, val] : node_->get_object()) {
            fn(std::string_view(key), JsonValue(root_, &val));
        }
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        auto doc = std::make_shared<glz::json_t>();
        const auto ec = glz::read_json(*doc, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        const glz::json_t* node = doc.get();
        return JsonValue(std::move(doc), node);
    }

private:
    JsonValue(std::shared_ptr<const glz::json_t> root, const glz::json_t* node)
        : root_(std::move(root)), node_(node) {}

    std::shared_ptr<const glz::json_t> root_;
    const glz::json_t* node_ = nullptr;
};

} // namespace querygate
