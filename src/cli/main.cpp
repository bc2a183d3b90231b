#include <algorithm>
#include <atomic>
#include <iterator>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "adapter/bluez_adapter.hpp"
#include "adapter/fake_adapter.hpp"
#include "gatt/catalog.hpp"
#include "session/peripheral.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

volatile std::sig_atomic_t g_stop = 0;

void on_sigint(int)
{
    g_stop = 1;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  gattlink [--adapter hciN] [--fake] [--services uuid,...] [--log-level L]\n"
                 "           <AA:BB:CC:DD:EE:FF> <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  services\n"
                 "  name\n"
                 "  rssi\n"
                 "  read <service> <characteristic>\n"
                 "  write <service> <characteristic> <hex> [--no-response]\n"
                 "  read-desc <service> <characteristic> <descriptor>\n"
                 "  write-desc <service> <characteristic> <descriptor> <hex>\n"
                 "  observe <service> <characteristic> [count]\n"
                 "\n"
                 "Environment: GATTLINK_ADAPTER, GATTLINK_ADAPTER_KIND=bluez|fake, GATTLINK_PEER,\n"
                 "             GATTLINK_SERVICES, GATTLINK_LOG_LEVEL\n");
}

static bool parse_hex(const std::string &s, adapter::Bytes &out)
{
    std::string digits;
    for (char c : s)
    {
        if (c == ':' || c == ' ' || c == '-')
            continue;
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
        digits.push_back(c);
    }
    if (digits.size() % 2 != 0)
        return false;
    out.clear();
    for (size_t i = 0; i < digits.size(); i += 2)
        out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    return true;
}

static std::string to_hex(const adapter::Bytes &b)
{
    static const char *kDigits = "0123456789abcdef";
    std::string        s;
    for (uint8_t v : b)
    {
        s.push_back(kDigits[v >> 4]);
        s.push_back(kDigits[v & 0x0f]);
    }
    return s;
}

// Stand-in device for --fake: battery, device information and a UART-like service.
static void populate_demo(adapter::FakeAdapter &fake, const adapter::DeviceId &dev)
{
    using namespace adapter;
    const std::string base = "/fake/" + dev;

    NativeService battery{"0000180f-0000-1000-8000-00805f9b34fb", base + "/service000c", {}};
    battery.characteristics.push_back(
        NativeCharacteristic{"00002a19-0000-1000-8000-00805f9b34fb",
                             battery.handle + "/char000d",
                             props::Read | props::Notify,
                             {NativeDescriptor{"00002902-0000-1000-8000-00805f9b34fb",
                                               battery.handle + "/char000d/desc000f"}}});

    NativeService info{"0000180a-0000-1000-8000-00805f9b34fb", base + "/service0010", {}};
    info.characteristics.push_back(
        NativeCharacteristic{"00002a29-0000-1000-8000-00805f9b34fb", info.handle + "/char0011",
                             props::Read, {}});

    NativeService uart{"6e400001-b5a3-f393-e0a9-e50e24dcca9e", base + "/service0020", {}};
    uart.characteristics.push_back(NativeCharacteristic{"6e400002-b5a3-f393-e0a9-e50e24dcca9e",
                                                        uart.handle + "/char0021",
                                                        props::Write | props::WriteWithoutResponse,
                                                        {}});
    uart.characteristics.push_back(
        NativeCharacteristic{"6e400003-b5a3-f393-e0a9-e50e24dcca9e",
                             uart.handle + "/char0023",
                             props::Notify,
                             {NativeDescriptor{"00002902-0000-1000-8000-00805f9b34fb",
                                               uart.handle + "/char0023/desc0025"}}});

    fake.set_services(dev, {battery, info, uart});
    fake.set_device_name(dev, "gattlink-demo");
    fake.set_characteristic_value(battery.characteristics[0].handle, {0x64});
    fake.set_characteristic_value(info.characteristics[0].handle,
                                  {'g', 'a', 't', 't', 'l', 'i', 'n', 'k'});
    NativeValue cccd;
    cccd.type = NativeValue::Type::UInt16;
    cccd.u16  = 0;
    fake.set_descriptor_value(battery.characteristics[0].descriptors[0].handle, cccd);
}

static void print_services(const std::vector<gatt::DiscoveredService> &services)
{
    for (const auto &svc : services)
    {
        std::printf("service %s\n", svc.uuid.c_str());
        for (const auto &chr : svc.characteristics)
        {
            std::printf("  characteristic %s [%s]\n", chr.uuid.c_str(),
                        gatt::properties_to_string(chr.properties).c_str());
            for (const auto &d : chr.descriptors)
                std::printf("    descriptor %s\n", d.uuid.c_str());
        }
    }
}

static int op_result(const session::Status &st)
{
    if (st)
        return exitc::ok;
    std::fprintf(stderr, "error: %s\n", session::to_string(st).c_str());
    return exitc::op_failed;
}

static int run_cmd(session::Peripheral            &p,
                   const std::vector<std::string> &args,
                   const std::function<void()>    &start_feed)
{
    const std::string &cmd = args[0];

    auto char_ref = [&]() { return gatt::CharacteristicRef{args[1], args[2]}; };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"services",
         [&]() -> int {
             auto services = p.services();
             if (!services)
                 return op_result(session::Status::error(session::Errc::NotReady,
                                                         "services not discovered"));
             print_services(*services);
             return exitc::ok;
         }},
        {"name",
         [&]() -> int {
             std::printf("%s\n", p.name().c_str());
             return exitc::ok;
         }},
        {"rssi",
         [&]() -> int {
             int  rssi = 0;
             auto st   = p.rssi(rssi);
             if (st)
                 std::printf("%d\n", rssi);
             return op_result(st);
         }},
        {"read",
         [&]() -> int {
             if (args.size() != 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             adapter::Bytes out;
             auto           st = p.read(char_ref(), out);
             if (st)
                 std::printf("%s\n", to_hex(out).c_str());
             return op_result(st);
         }},
        {"write",
         [&]() -> int {
             if (args.size() != 4 && args.size() != 5)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             adapter::WriteType type = adapter::WriteType::WithResponse;
             if (args.size() == 5)
             {
                 if (args[4] != "--no-response")
                 {
                     print_usage();
                     return exitc::bad_args;
                 }
                 type = adapter::WriteType::WithoutResponse;
             }
             adapter::Bytes data;
             if (!parse_hex(args[3], data))
             {
                 std::fprintf(stderr, "error: invalid hex payload: %s\n", args[3].c_str());
                 return exitc::bad_args;
             }
             return op_result(p.write(char_ref(), data, type));
         }},
        {"read-desc",
         [&]() -> int {
             if (args.size() != 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             adapter::Bytes out;
             auto           st = p.read(gatt::DescriptorRef{args[1], args[2], args[3]}, out);
             if (st)
                 std::printf("%s\n", to_hex(out).c_str());
             return op_result(st);
         }},
        {"write-desc",
         [&]() -> int {
             if (args.size() != 5)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             adapter::Bytes data;
             if (!parse_hex(args[4], data))
             {
                 std::fprintf(stderr, "error: invalid hex payload: %s\n", args[4].c_str());
                 return exitc::bad_args;
             }
             return op_result(p.write(gatt::DescriptorRef{args[1], args[2], args[3]}, data));
         }},
        {"observe",
         [&]() -> int {
             if (args.size() != 3 && args.size() != 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             long want = args.size() == 4 ? std::strtol(args[3].c_str(), nullptr, 10) : 0;
             if (want < 0)
             {
                 std::fprintf(stderr, "error: invalid count: %s\n", args[3].c_str());
                 return exitc::bad_args;
             }
             std::unique_ptr<gatt::Subscription> sub;
             auto                                st = p.observe(char_ref(), sub);
             if (!st)
                 return op_result(st);
             if (start_feed)
                 start_feed();

             long seen = 0;
             while (!g_stop && (want == 0 || seen < want))
             {
                 gatt::ObservationEvent ev;
                 if (!sub->next_for(ev, std::chrono::milliseconds(200)))
                     continue;
                 if (ev.type == gatt::ObservationEvent::Type::Value)
                 {
                     std::printf("%s\n", to_hex(ev.value).c_str());
                     std::fflush(stdout);
                     ++seen;
                 }
                 else if (ev.type == gatt::ObservationEvent::Type::Error)
                 {
                     LOG_WARN("observe: %s (%d)", ev.message.c_str(), ev.code);
                 }
                 else
                 {
                     return op_result(
                         session::Status::connection_lost(std::nullopt, "link dropped while observing"));
                 }
             }
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    gattlink::Config cfg = gattlink::Config::from_env();

    std::vector<std::string> args;
    args.reserve(argc > 1 ? argc - 1 : 0);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--adapter" && i + 1 < argc)
        {
            cfg.adapter = argv[++i];
        }
        else if (a == "--fake")
        {
            cfg.adapter_kind = gattlink::AdapterKind::Fake;
        }
        else if (a == "--services" && i + 1 < argc)
        {
            cfg.service_filter.clear();
            for (const auto &u : gattlink::split_list(argv[++i]))
            {
                std::string uuid = gatt::normalize_uuid(u);
                if (uuid.empty())
                {
                    std::fprintf(stderr, "error: invalid service UUID: %s\n", u.c_str());
                    return exitc::bad_args;
                }
                cfg.service_filter.push_back(uuid);
            }
        }
        else if (a == "--log-level" && i + 1 < argc)
        {
            gattlink::set_log_level_by_name(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }

    // peer: first positional, unless GATTLINK_PEER already names it
    if (!args.empty() && gattlink::is_valid_mac(gattlink::normalize_mac(args[0])))
    {
        cfg.peer = gattlink::normalize_mac(args[0]);
        args.erase(args.begin());
    }
    if (cfg.peer.empty() || args.empty())
    {
        if (cfg.peer.empty() && !args.empty())
            std::fprintf(stderr, "error: invalid MAC address: %s\n", args[0].c_str());
        print_usage();
        return exitc::bad_args;
    }

    static const char *const kCommands[] = {"services", "name",      "rssi",       "read",
                                            "write",    "read-desc", "write-desc", "observe"};
    if (std::find(std::begin(kCommands), std::end(kCommands), args[0]) == std::end(kCommands))
    {
        std::fprintf(stderr, "Unknown command: %s\n", args[0].c_str());
        print_usage();
        return exitc::bad_args;
    }

    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    std::unique_ptr<adapter::NativeAdapter> native;
    adapter::FakeAdapter                   *fake = nullptr;
    if (cfg.adapter_kind == gattlink::AdapterKind::Fake)
    {
        auto f = std::make_unique<adapter::FakeAdapter>();
        populate_demo(*f, cfg.peer);
        fake   = f.get();
        native = std::move(f);
    }
    else
    {
        auto bluez = std::make_unique<adapter::BluezAdapter>(adapter::BluezConfig{cfg.adapter});
        if (!bluez->start())
        {
            std::fprintf(stderr, "error: cannot open BlueZ adapter %s\n", cfg.adapter.c_str());
            return exitc::connect_failed;
        }
        native = std::move(bluez);
    }

    // Fake notifications for `observe`: a battery level that counts down.
    std::atomic<bool> feeding{false};
    std::thread       feeder;
    auto              start_feed = [&] {
        if (!fake)
            return;
        feeding.store(true);
        feeder = std::thread([&] {
            uint8_t level = 100;
            while (feeding.load())
            {
                fake->emit_value(cfg.peer, "/fake/" + cfg.peer + "/service000c/char000d", {level});
                level = level > 0 ? level - 1 : 100;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    };

    int rc = exitc::ok;
    {
        session::PeripheralOptions opts;
        opts.service_filter = cfg.service_filter;
        opts.on_mtu_changed = [](int mtu) { LOG_DEBUG("MTU %d", mtu); };

        session::Peripheral p(*native, cfg.peer, std::move(opts));
        session::Status     st = p.connect();
        if (!st)
        {
            std::fprintf(stderr, "error: connect %s failed: %s\n", cfg.peer.c_str(),
                         session::to_string(st).c_str());
            rc = exitc::connect_failed;
        }
        else
        {
            rc = run_cmd(p, args, start_feed);
            feeding.store(false);
            if (feeder.joinable())
                feeder.join();
            st = p.disconnect();
            if (!st)
                LOG_WARN("disconnect %s: %s", cfg.peer.c_str(), session::to_string(st).c_str());
        }
    }
    native.reset();
    return rc;
}
