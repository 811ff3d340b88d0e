#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace RelayPipe {

    /**
     * @brief key=value settings store
     *
     * Lines starting with '#' are comments. The server keeps its settings in
     * the process-wide instance(); the client builds its own Config so that
     * the loaded file never leaks into server code running in the same
     * process (tests).
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;
        void clear();

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        double getDouble(const std::string& key, double defaultValue = 0.0) const;
        void setDouble(const std::string& key, double value);

        /**
         * @brief Run each validator against its key, when the key is set
         * @param failedKey receives the first key that failed, if non-null
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

        // Common validators
        static Validator intInRange(long long minValue, long long maxValue);
        static Validator oneOf(std::vector<std::string> allowed);

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
