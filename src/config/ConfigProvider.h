#pragma once

#include "config/Config.h"

#include <string>
#include <vector>

namespace config {

class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const { return cfg_; }

    static OutputFormat parseOutputFormat(const std::string& s);
    static std::string usage();

private:
    Config cfg_;
    void parseCli_(int argc, const char* const* argv);
    void parseEnv_();
    void parseFile_(const std::string& path);
    void applyKey_(const std::string& key, const std::string& value, const std::string& origin);
    void validate_() const;

    static bool fileExists_(const std::string& path);
    static std::string trim_(const std::string& s);
    static bool parseBool_(const std::string& value, bool& out);
    static bool parseInt_(const std::string& value, int& out);
    static bool parseInt64_(const std::string& value, long long& out);
    static bool parseTimeUnitIsMs_(const std::string& value, bool& out);
    static std::string lowercase_(std::string s);
};

}  // namespace config
