#include "snapshot.hpp"
#include <cstdio>

namespace {
template <typename T>
bool get_as(const std::map<std::string, FieldValue>& fields, const std::string& name, T& out) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return false;
    }
    const T* value = std::get_if<T>(&it->second);
    if (!value) {
        return false;
    }
    out = *value;
    return true;
}
} // namespace

const FieldValue* StateSnapshot::find(const std::string& name) const {
    auto it = fields_.find(name);
    return it == fields_.end() ? nullptr : &it->second;
}

bool StateSnapshot::get_flag(const std::string& name, bool& out) const {
    return get_as(fields_, name, out);
}

bool StateSnapshot::get_int(const std::string& name, int64_t& out) const {
    return get_as(fields_, name, out);
}

bool StateSnapshot::get_real(const std::string& name, double& out) const {
    return get_as(fields_, name, out);
}

bool StateSnapshot::get_text(const std::string& name, std::string& out) const {
    return get_as(fields_, name, out);
}

std::string format_field(const FieldValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        char buf[32]{};
        std::snprintf(buf, sizeof(buf), "%.1f", *d);
        return buf;
    }
    return std::get<std::string>(value);
}
