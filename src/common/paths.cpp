#include "livebar/common/paths.hpp"
#include "livebar/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace livebar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    std::string user_config = getUserConfigFile();
    if (!user_config.empty()) {
        paths.push_back(user_config);
    }

    paths.push_back(getSystemConfigFile());

    return paths;
}

std::string PathManager::getUserConfigFile() const {
    std::string config_home = getXdgConfigHome();
    if (config_home.empty()) {
        return "";
    }
    return config_home + "/" + constants::system::APPLICATION_NAME + "/" +
           constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getSystemConfigFile() const {
    return std::string("/etc/") + constants::system::APPLICATION_NAME + "/" +
           constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getLogDir() const {
    std::string state_home = getXdgStateHome();
    if (state_home.empty()) {
        return "./logs";
    }
    return state_home + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getDefaultLogFile() const {
    return getLogDir() + "/" + constants::system::APPLICATION_NAME + ".log";
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

}}
