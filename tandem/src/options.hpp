#pragma once

#include <string>
#include <unordered_map>
#include <cctype>
#include <charconv>
#include <functional>

namespace tandem {

class Options {
public:
    void set(const std::string &key, const std::string &value) {
        storage_[normalizeKey(key)] = value;
    }

    std::string get(const std::string &key, const std::string &defaultValue) const {
        const std::string nk = normalizeKey(key);
        auto it = storage_.find(nk);
        return it == storage_.end() ? defaultValue : it->second;
    }

    // Unparsable or missing values fall back to the default.
    long long getInt(const std::string &key, long long defaultValue) const {
        auto it = storage_.find(normalizeKey(key));
        if (it == storage_.end() || it->second.empty()) return defaultValue;
        long long out = 0;
        const char *first = it->second.data();
        const char *last = first + it->second.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec != std::errc() || ptr != last) return defaultValue;
        return out;
    }

    bool getBool(const std::string &key, bool defaultValue) const {
        auto it = storage_.find(normalizeKey(key));
        if (it == storage_.end()) return defaultValue;
        const std::string v = normalizeKey(it->second);
        if (v == "true" || v == "1" || v == "on" || v.empty()) return true;
        if (v == "false" || v == "0" || v == "off") return false;
        return defaultValue;
    }

    bool contains(const std::string &key) const { return storage_.count(normalizeKey(key)) > 0; }

    void clear() { storage_.clear(); }

    void forEach(const std::function<void(const std::string&, const std::string&)> &fn) const {
        for (const auto &kv : storage_) fn(kv.first, kv.second);
    }

private:
    static std::string normalizeKey(const std::string &in) {
        std::string out;
        out.reserve(in.size());
        for (char c : in) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::unordered_map<std::string, std::string> storage_;
};

} // namespace tandem
