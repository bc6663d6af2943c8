#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

template <typename Key>
inline void step(const json *&ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        ref = &ref->at(key);
    else
        ref = nullptr;
}

template <typename... Keys>
inline const json *find(const json &j, const Keys &... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    (step(ref, keys), ...);
    return ref;
}

}  // namespace detail_access

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_access::find(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_access::find(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_access::find(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
const T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
const T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
