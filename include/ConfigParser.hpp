#pragma once

#include <string>
#include <vector>

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned int MinValue, unsigned int MaxValue, unsigned int& Out);
    bool ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out);

    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
