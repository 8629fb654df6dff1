#pragma once

#include <string>
#include <string_view>

// A C++-like interface for manipulating environment variables.
class Env {
   public:
    Env() = default;

    class ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        // Aka, setenv
        const Env::ValueEntry& operator=(const std::string_view value) const;
        // Aka, unsetenv
        void clear() const;
        // Aka, getenv
        // Throws std::invalid_argument if unset.
        [[nodiscard]] std::string get() const;

        [[nodiscard]] bool has() const;

        template <typename T>
        bool assign(T& ref) const {
            if (has()) {
                ref = get();
                return true;
            }
            return false;
        }
        [[nodiscard]] std::string_view key() const { return _key; }

        ValueEntry() = delete;
        ~ValueEntry() = default;
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};
