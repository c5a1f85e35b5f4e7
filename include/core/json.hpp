#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace auditpipe {

/**
 * @brief Thin wrapper around glz::json_t for event payloads and wire records
 *
 * Stores json_t by value. Const operator[] returns copies, so lookups on
 * absent keys yield null instead of inserting. Mutation goes through set()
 * and push_back(). Numbers are held as double, as in json_t.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;
    using null_t = glz::json_t::null_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    JsonValue(T v) { data_ = static_cast<double>(v); }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(std::string_view v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(key) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(key);
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Mutation =====

    // Turns a non-object into an empty object first
    void set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get<object_t>()[std::string(key)] = std::move(val.data_);
    }

    bool erase(std::string_view key) {
        if (!data_.is_object()) return false;
        auto& obj = data_.get<object_t>();
        auto it = obj.find(key);
        if (it == obj.end()) return false;
        obj.erase(it);
        return true;
    }

    // Turns a non-array into an empty array first
    void push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get<array_t>().emplace_back(std::move(val.data_));
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // Falls back to default_value when the key is absent or of another type
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue v = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return v.is_string() ? v.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v.is_boolean() ? v.get<bool>() : default_value;
        } else {
            return v.is_number() ? v.get<T>() : default_value;
        }
    }

    /**
     * @brief Truthiness: null, false, 0, NaN and "" are falsy;
     *        everything else (including empty objects and arrays) is truthy.
     */
    [[nodiscard]] bool is_truthy() const {
        if (data_.is_null()) return false;
        if (data_.is_boolean()) return data_.get<bool>();
        if (data_.is_number()) {
            const double d = data_.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        if (data_.is_string()) return !data_.get<std::string>().empty();
        return true;
    }

    /**
     * @brief Scalar rendering used for substring and pattern matching.
     *
     * Strings render raw, integral numbers without a fraction, booleans as
     * true/false, null as "null", containers as compact JSON.
     */
    [[nodiscard]] std::string to_display_string() const {
        if (data_.is_string()) return data_.get<std::string>();
        if (data_.is_boolean()) return data_.get<bool>() ? "true" : "false";
        if (data_.is_null()) return "null";
        if (data_.is_number()) {
            const double d = data_.get<double>();
            if (is_number_integer() && std::fabs(d) < 9.0e15) {
                return std::format("{}", static_cast<long long>(d));
            }
            return std::format("{}", d);
        }
        return dump();
    }

    [[nodiscard]] bool operator==(const JsonValue& other) const {
        if (is_null() || other.is_null()) return is_null() && other.is_null();
        if (is_boolean() && other.is_boolean()) return get<bool>() == other.get<bool>();
        if (is_number() && other.is_number()) return get<double>() == other.get<double>();
        if (is_string() && other.is_string()) return get<std::string>() == other.get<std::string>();
        if (is_array() && other.is_array()) {
            if (size() != other.size()) return false;
            for (size_t i = 0; i < size(); ++i) {
                if (!((*this)[i] == other[i])) return false;
            }
            return true;
        }
        if (is_object() && other.is_object()) {
            if (size() != other.size()) return false;
            for (const auto& [k, v] : data_.get_object()) {
                if (!other.contains(k) || !(JsonValue(v) == other[k])) return false;
            }
            return true;
        }
        return false;
    }

    // ===== Items Range (for structured bindings over objects) =====

    class items_range {
        const object_t* obj_;

    public:
        explicit items_range(const object_t* obj) : obj_(obj) {}

        class iterator {
            object_t::const_iterator it_;

        public:
            explicit iterator(object_t::const_iterator it) : it_(it) {}

            [[nodiscard]] std::pair<std::string, JsonValue> operator*() const {
                return {it_->first, JsonValue(it_->second)};
            }

            iterator& operator++() { ++it_; return *this; }
            [[nodiscard]] bool operator!=(const iterator& o) const { return it_ != o.it_; }
        };

        [[nodiscard]] iterator begin() const { return iterator(obj_->begin()); }
        [[nodiscard]] iterator end() const { return iterator(obj_->end()); }
    };

    [[nodiscard]] items_range items() const {
        static const object_t empty_obj;
        if (data_.is_object()) {
            return items_range(&data_.get_object());
        }
        return items_range(&empty_obj);
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error(std::format("JSON parse error: {}",
                glz::format_error(ec, buffer)));
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialization =====

    [[nodiscard]] std::string dump() const {
        std::string buffer;
        if (auto ec = glz::write_json(data_, buffer)) {
            throw std::runtime_error(std::format("JSON write error: {}",
                glz::format_error(ec, buffer)));
        }
        return buffer;
    }

    // ===== Raw Access =====

    [[nodiscard]] glz::json_t& raw() { return data_; }
    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace auditpipe
