#pragma once

#include <string>
#include <vector>

namespace livebar {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::vector<std::string> getConfigSearchPaths() const;

    std::string getUserConfigFile() const;
    std::string getSystemConfigFile() const;
    std::string getLogDir() const;
    std::string getDefaultLogFile() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
