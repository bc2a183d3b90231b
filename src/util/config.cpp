#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

#include "gatt/catalog.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace gattlink
{

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

std::string normalize_mac(std::string mac)
{
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

std::vector<std::string> split_list(const std::string &csv)
{
    std::vector<std::string> out;
    std::string              cur;
    auto                     flush = [&] {
        auto l = cur.find_first_not_of(" \t");
        auto r = cur.find_last_not_of(" \t");
        if (l != std::string::npos)
            out.push_back(cur.substr(l, r - l + 1));
        cur.clear();
    };
    for (char c : csv)
    {
        if (c == ',')
            flush();
        else
            cur.push_back(c);
    }
    flush();
    return out;
}

Config Config::from_env()
{
    Config cfg;

    if (const char *lv = std::getenv("GATTLINK_LOG_LEVEL"))
        set_log_level_by_name(lv);

    if (const char *k = std::getenv("GATTLINK_ADAPTER_KIND"))
    {
        if (std::strcmp(k, "fake") == 0)
            cfg.adapter_kind = AdapterKind::Fake;
        else if (std::strcmp(k, "bluez") == 0)
            cfg.adapter_kind = AdapterKind::Bluez;
        else
            LOG_WARN("Ignoring invalid GATTLINK_ADAPTER_KIND='%s' (expect bluez|fake)", k);
    }

    if (const char *a = std::getenv("GATTLINK_ADAPTER"); a && *a)
        cfg.adapter = a;

    if (const char *p = std::getenv("GATTLINK_PEER"); p && *p)
    {
        std::string mac = normalize_mac(p);
        if (is_valid_mac(mac))
            cfg.peer = mac;
        else
            LOG_WARN("Ignoring invalid GATTLINK_PEER='%s'", p);
    }

    if (const char *s = std::getenv("GATTLINK_SERVICES"); s && *s)
    {
        for (const auto &u : split_list(s))
        {
            std::string uuid = gatt::normalize_uuid(u);
            if (uuid.empty())
            {
                LOG_WARN("Ignoring invalid service UUID '%s' in GATTLINK_SERVICES", u.c_str());
                continue;
            }
            cfg.service_filter.push_back(std::move(uuid));
        }
    }

    LOG_DEBUG("Config: kind=%s adapter=%s peer=%s services=%zu",
              cfg.adapter_kind == AdapterKind::Fake ? "fake" : "bluez", cfg.adapter.c_str(),
              cfg.peer.empty() ? "(none)" : cfg.peer.c_str(), cfg.service_filter.size());
    return cfg;
}

}  // namespace gattlink
