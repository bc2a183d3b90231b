#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifndef GATTLINK_SOURCE_DIR
#error "GATTLINK_SOURCE_DIR must be defined by CMake to the project source root"
#endif

struct Check
{
    const char              *label;
    const char              *rel_path;
    std::vector<std::string> needles;  // all substrings must appear in the SAME line
    bool                     allow_prev_line_macro = true;  // sometimes macro is on prev line
};

static std::string read_file(const std::string &path)
{
    std::ifstream      ifs(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static bool line_has_all(const std::string &line, const std::vector<std::string> &needles)
{
    for (const auto &n : needles)
    {
        if (line.find(n) == std::string::npos)
            return false;
    }
    return true;
}

// Every line carrying the needles must log at SYSTEM level.
static bool has_system_macro_near(const std::string              &content,
                                  const std::vector<std::string> &needles,
                                  bool                            allow_prev)
{
    std::istringstream iss(content);
    std::string        line, prev;
    bool               found = false;
    while (std::getline(iss, line))
    {
        if (line_has_all(line, needles))
        {
            const bool on_same = line.find("LOG_SYSTEM(") != std::string::npos;
            const bool on_prev = allow_prev && prev.find("LOG_SYSTEM(") != std::string::npos;
            if (!on_same && !on_prev)
                return false;
            found = true;
        }
        prev = line;
    }
    // message not found => fail
    return found;
}

// State transitions and link outcomes are always shown, whatever the log level.
TEST(SessionLogs, TransitionsAreSystemLevel)
{
    const std::vector<Check> checks = {
        // clang-format off
        {"state change", "src/session/peripheral.cpp", {"[SESSION] %s: %s", "to_string(s)"}},
        {"link up", "src/session/peripheral.cpp", {"[SESSION] %s: %s", "to_string(next)"}},
        {"configuring", "src/session/peripheral_connect.cpp", {"[SESSION] %s: %s", "to_string(cfg)"}},
        {"connected", "src/session/peripheral_connect.cpp", {"[SESSION] %s: %s", "to_string(next)"}},
        {"disconnecting", "src/session/peripheral_connect.cpp", {"[SESSION] %s: %s", "to_string(closing)"}},

        {"Powered", "src/adapter/bluez_helper.cpp", {"[BLUEZ]", "Powered="}},
        {"Device connected", "src/adapter/bluez_helper.cpp", {"Device connected:"}},
        {"Disconnected", "src/adapter/bluez_helper.cpp", {"[BLUEZ] Disconnected", "("}},
        {"adapter removed", "src/adapter/bluez_helper.cpp", {"[BLUEZ] adapter", "removed"}},
        {"InterfacesRemoved", "src/adapter/bluez_helper.cpp", {"InterfacesRemoved -> device"}},
        // clang-format on
    };

    for (const auto &c : checks)
    {
        const std::string path    = std::string(GATTLINK_SOURCE_DIR) + "/" + c.rel_path;
        const std::string content = read_file(path);
        ASSERT_FALSE(content.empty()) << "Missing file: " << path;
        const bool ok = has_system_macro_near(content, c.needles, c.allow_prev_line_macro);
        if (!ok)
        {
            std::ostringstream err;
            err << "Log for [" << c.label << "] is not LOG_SYSTEM near message in " << path
                << " (needles: ";
            for (size_t i = 0; i < c.needles.size(); ++i)
            {
                if (i)
                    err << ", ";
                err << '"' << c.needles[i] << '"';
            }
            err << ")";
            ADD_FAILURE() << err.str();
        }
    }
}
