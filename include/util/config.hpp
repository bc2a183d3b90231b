#pragma once
#include <string>
#include <vector>

namespace gattlink
{

enum class AdapterKind
{
    Bluez,
    Fake
};

struct Config
{
    AdapterKind              adapter_kind = AdapterKind::Bluez;
    std::string              adapter      = "hci0";
    std::string              peer;            // "AA:BB:CC:DD:EE:FF", empty when unset
    std::vector<std::string> service_filter;  // empty = discover all services

    // GATTLINK_ADAPTER_KIND, GATTLINK_ADAPTER, GATTLINK_PEER, GATTLINK_SERVICES,
    // GATTLINK_LOG_LEVEL. Invalid values are logged and ignored.
    static Config from_env();
};

bool                     is_valid_mac(const std::string &mac);
std::string              normalize_mac(std::string mac);
std::vector<std::string> split_list(const std::string &csv);

}  // namespace gattlink
