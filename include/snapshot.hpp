#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

// Enumerations are stored as their symbolic name.
using FieldValue = std::variant<bool, int64_t, double, std::string>;

// Merged view of every record decoded during one session. Writing a field
// that already exists replaces it.
class StateSnapshot {
public:
    void set_flag(const char* name, bool value) { fields_[name] = value; }
    void set_int(const char* name, int64_t value) { fields_[name] = value; }
    void set_real(const char* name, double value) { fields_[name] = value; }
    void set_text(const char* name, const char* value) { fields_[name] = std::string(value); }

    bool contains(const std::string& name) const { return fields_.count(name) != 0; }
    const FieldValue* find(const std::string& name) const;

    bool get_flag(const std::string& name, bool& out) const;
    bool get_int(const std::string& name, int64_t& out) const;
    bool get_real(const std::string& name, double& out) const;
    bool get_text(const std::string& name, std::string& out) const;


    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    const std::map<std::string, FieldValue>& fields() const { return fields_; }

private:
    std::map<std::string, FieldValue> fields_;
};

std::string format_field(const FieldValue& value);
