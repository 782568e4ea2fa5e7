/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/**
* Quay network policy command line tool
*
*/

#include <Logging.h>
#include <FileUtilities.h>
#include <Settings.h>

#include <NetworkPolicyManager.h>
#include <ConfigStore.h>
#include <Netlink.h>
#include <ProcessRunner.h>
#include <MachinectlRuntime.h>

#include <json/json.h>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <ctype.h>
#include <errno.h>

#include <functional>
#include <iostream>
#include <map>
#include <vector>

#define DEFAULT_SETTINGS_PATH "/etc/quay/quay.json"

#define EXIT_USAGE          1
#define EXIT_POLICY_BASE    2

// Some globals variables for command line arguments
static std::string settingsPath;
static bool settingsPathGiven = false;
static int verbosity = 0;

typedef std::vector<std::string> Args;

// -----------------------------------------------------------------------------
/**
 * @brief Shows usage/help info
 */
static void displayUsage()
{
    printf("Usage: quay-netctl <option(s)> <command> [args]\n");
    printf("  Manages the container network and firewall policy\n");
    printf("\n");
    printf("  -h, --help                    Print this help and exit\n");
    printf("  -v, --verbose                 Increase the log level\n");
    printf("  -s, --settings=PATH           Path to the settings file (default %s)\n", DEFAULT_SETTINGS_PATH);
    printf("\n");
    printf("Commands:\n");
    printf("  show                                  Print the resolved state as JSON\n");
    printf("  render                                Print the rules for the active backend\n");
    printf("  apply                                 Re-install the rules for the persisted state\n");
    printf("  set-bridge <name>\n");
    printf("  set-lan <cidr> <gateway>\n");
    printf("  set-wan <iface|auto>\n");
    printf("  set-backend <nftables|iptables>\n");
    printf("  set-proxy <on|off> [upstream]\n");
    printf("  add-portmap <container> <tcp|udp> <hostPort> <containerPort> [ipv4]\n");
    printf("  rm-portmap <tcp|udp> <hostPort>\n");
    printf("  refresh-portmaps <container>\n");
    printf("  add-acl <container> <tcp|udp> <port> [ipv6]\n");
    printf("  rm-acl <tcp|udp> <port> <ipv6>\n");
    printf("  container-deleted <container>\n");
    printf("  ipv6-native <prefix>\n");
    printf("  ipv6-6in4 <localV4> <serverV4> <clientV6/len> <serverV6> <routedPrefix>\n");
    printf("  ipv6-wireguard <iface> <peer-config-file> <routedPrefix>\n");
    printf("  ipv6-none\n");
    printf("\n");
}

// -----------------------------------------------------------------------------
/**
 * @brief Read and parse the command-line arguments
 */
static void parseArgs(const int argc, char **argv)
{
    struct option longopts[] =
        {
            {"help", no_argument, nullptr, (int)'h'},
            {"verbose", no_argument, nullptr, (int)'v'},
            {"settings", required_argument, nullptr, (int)'s'},
            {nullptr, 0, nullptr, 0}};

    int opt;
    int index;

    settingsPath = DEFAULT_SETTINGS_PATH;

    // stop at the first non-option, that's the command
    while ((opt = getopt_long(argc, argv, "+hvs:", longopts, &index)) != -1)
    {
        switch (opt)
        {
        case 'h':
            displayUsage();
            exit(EXIT_SUCCESS);
            break;
        case 'v':
            verbosity++;
            break;
        case 's':
            settingsPath = reinterpret_cast<const char *>(optarg);
            settingsPathGiven = true;
            break;
        case '?':
            if (optopt == 's')
                fprintf(stderr, "Warning: Option -%c requires an argument.\n", optopt);
            else if (isprint(optopt))
                fprintf(stderr, "Warning: Unknown option `-%c'.\n", optopt);
            else
                fprintf(stderr, "Warning: Unknown option character `\\x%x'.\n", optopt);
            exit(EXIT_USAGE);
            break;
        default:
            exit(EXIT_USAGE);
            break;
        }
    }
}

// -----------------------------------------------------------------------------
/**
 * @brief   Load settings from the provided path
 *          Loads default settings if no file was given and the default one
 *          doesn't exist
 */
static std::shared_ptr<Settings> readSettings()
{
    std::shared_ptr<Settings> settings;
    if (access(settingsPath.c_str(), R_OK) == 0)
    {
        QUAY_LOG_INFO("parsing settings from file @ '%s'", settingsPath.c_str());
        settings = Settings::fromJsonFile(settingsPath);
    }
    else if (settingsPathGiven)
    {
        QUAY_LOG_SYS_ERROR(errno, "cannot access settings file '%s'", settingsPath.c_str());
    }
    else
    {
        QUAY_LOG_WARN("missing or inaccessible settings file, using defaults");
        settings = Settings::defaultSettings();
    }

    return settings;
}

// -----------------------------------------------------------------------------
/**
 * @brief Parses a decimal number, the manager does the range checking
 */
static bool parseNumber(const std::string& str, unsigned long* value)
{
    if (str.empty() || !isdigit(static_cast<unsigned char>(str[0])))
        return false;

    errno = 0;
    char* end = nullptr;
    *value = strtoul(str.c_str(), &end, 10);

    return (errno == 0) && (end != nullptr) && (*end == '\0');
}

static bool parseProtocol(const std::string& str, Protocol* protocol)
{
    boost::optional<Protocol> parsed = protocolFromString(str);
    if (!parsed)
    {
        fprintf(stderr, "Error: unknown protocol '%s', expected tcp or udp\n", str.c_str());
        return false;
    }

    *protocol = parsed.get();
    return true;
}

static bool parsePort(const std::string& str, unsigned long* port)
{
    if (!parseNumber(str, port))
    {
        fprintf(stderr, "Error: '%s' is not a port number\n", str.c_str());
        return false;
    }
    return true;
}

static int policyExitCode(const PolicyResult& result)
{
    if (result.ok())
        return EXIT_SUCCESS;

    fprintf(stderr, "Error: %s: %s\n", policyErrorName(result.error), result.detail.c_str());
    return EXIT_POLICY_BASE + static_cast<int>(result.error);
}

// -----------------------------------------------------------------------------
/**
 * @brief Prints the fully resolved state as JSON on stdout
 */
static int showCommand(NetworkPolicyManager& manager, const Args& args)
{
    (void)args;

    const PolicyState state = manager.getState();

    Json::Value root(Json::objectValue);
    root["network"] = ConfigStore::toJson(state.config);

    Json::Value portMaps(Json::arrayValue);
    for (const PortMapEntry& entry : state.portMaps)
        portMaps.append(ConfigStore::toJson(entry));
    root["portMaps"] = portMaps;

    Json::Value acls(Json::arrayValue);
    for (const Ipv6AclEntry& entry : state.acls)
        acls.append(ConfigStore::toJson(entry));
    root["acls"] = acls;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    std::cout << Json::writeString(builder, root) << std::endl;

    return EXIT_SUCCESS;
}

static int renderCommand(NetworkPolicyManager& manager, const Args& args)
{
    (void)args;

    std::string rendered;
    PolicyResult result = manager.renderActive(&rendered);
    if (result.ok())
        std::cout << rendered;

    return policyExitCode(result);
}

static int applyCommand(NetworkPolicyManager& manager, const Args& args)
{
    (void)args;
    return policyExitCode(manager.reapply());
}

static int setBridgeCommand(NetworkPolicyManager& manager, const Args& args)
{
    return policyExitCode(manager.setBridge(args[0]));
}

static int setLanCommand(NetworkPolicyManager& manager, const Args& args)
{
    return policyExitCode(manager.setLan4(args[0], args[1]));
}

static int setWanCommand(NetworkPolicyManager& manager, const Args& args)
{
    return policyExitCode(manager.setWanInterface(args[0]));
}

static int setBackendCommand(NetworkPolicyManager& manager, const Args& args)
{
    boost::optional<NatBackend> backend = natBackendFromString(args[0]);
    if (!backend)
    {
        fprintf(stderr, "Error: unknown backend '%s', expected nftables or iptables\n",
                args[0].c_str());
        return EXIT_USAGE;
    }

    return policyExitCode(manager.setNatBackend(backend.get()));
}

static int setProxyCommand(NetworkPolicyManager& manager, const Args& args)
{
    bool enabled;
    if (args[0] == "on")
        enabled = true;
    else if (args[0] == "off")
        enabled = false;
    else
    {
        fprintf(stderr, "Error: expected 'on' or 'off'\n");
        return EXIT_USAGE;
    }

    const std::string upstream = (args.size() > 1) ? args[1] : std::string();
    return policyExitCode(manager.setIpv6Proxy(enabled, upstream));
}

static int addPortMapCommand(NetworkPolicyManager& manager, const Args& args)
{
    Protocol protocol;
    unsigned long hostPort, containerPort;
    if (!parseProtocol(args[1], &protocol) ||
        !parsePort(args[2], &hostPort) ||
        !parsePort(args[3], &containerPort))
        return EXIT_USAGE;

    const std::string address = (args.size() > 4) ? args[4] : std::string();
    return policyExitCode(manager.addPortMap(args[0], protocol, hostPort,
                                             containerPort, address));
}

static int removePortMapCommand(NetworkPolicyManager& manager, const Args& args)
{
    Protocol protocol;
    unsigned long hostPort;
    if (!parseProtocol(args[0], &protocol) || !parsePort(args[1], &hostPort))
        return EXIT_USAGE;

    return policyExitCode(manager.removePortMap(protocol, hostPort));
}

static int refreshPortMapsCommand(NetworkPolicyManager& manager, const Args& args)
{
    return policyExitCode(manager.refreshPortMaps(args[0]));
}

static int addAclCommand(NetworkPolicyManager& manager, const Args& args)
{
    Protocol protocol;
    unsigned long port;
    if (!parseProtocol(args[1], &protocol) || !parsePort(args[2], &port))
        return EXIT_USAGE;

    const std::string address = (args.size() > 3) ? args[3] : std::string();
    return policyExitCode(manager.addAcl(args[0], protocol, port, address));
}

static int removeAclCommand(NetworkPolicyManager& manager, const Args& args)
{
    Protocol protocol;
    unsigned long port;
    if (!parseProtocol(args[0], &protocol) || !parsePort(args[1], &port))
        return EXIT_USAGE;

    return policyExitCode(manager.removeAcl(protocol, port, args[2]));
}

static int containerDeletedCommand(NetworkPolicyManager& manager, const Args& args)
{
    return policyExitCode(manager.onContainerDeleted(args[0]));
}

static int ipv6NativeCommand(NetworkPolicyManager& manager, const Args& args)
{
    TransportRequest request;
    request.method = TransportMethod::Native;
    request.routedPrefix = args[0];

    return policyExitCode(manager.configureIpv6Transport(request));
}

static int ipv6SixInFourCommand(NetworkPolicyManager& manager, const Args& args)
{
    TransportRequest request;
    request.method = TransportMethod::SixInFour;
    request.localV4 = args[0];
    request.serverV4 = args[1];
    request.clientV6 = args[2];
    request.serverV6 = args[3];
    request.routedPrefix = args[4];

    return policyExitCode(manager.configureIpv6Transport(request));
}

static int ipv6WireguardCommand(NetworkPolicyManager& manager, const Args& args)
{
    boost::optional<std::string> config = QuayCommon::readTextFile(args[1]);
    if (!config)
    {
        fprintf(stderr, "Error: failed to read peer config '%s'\n", args[1].c_str());
        return EXIT_USAGE;
    }

    TransportRequest request;
    request.method = TransportMethod::Wireguard;
    request.wgIface = args[0];
    request.wgConfig = config.get();
    request.routedPrefix = args[2];

    return policyExitCode(manager.configureIpv6Transport(request));
}

static int ipv6NoneCommand(NetworkPolicyManager& manager, const Args& args)
{
    (void)args;

    TransportRequest request;
    request.method = TransportMethod::None;

    return policyExitCode(manager.configureIpv6Transport(request));
}

// -----------------------------------------------------------------------------
/**
 * @brief The table of commands with the number of args each accepts
 */
struct Command
{
    size_t minArgs;
    size_t maxArgs;
    std::function<int(NetworkPolicyManager&, const Args&)> handler;
};

static const std::map<std::string, Command> commands =
{
    { "show",               { 0, 0, showCommand } },
    { "render",             { 0, 0, renderCommand } },
    { "apply",              { 0, 0, applyCommand } },
    { "set-bridge",         { 1, 1, setBridgeCommand } },
    { "set-lan",            { 2, 2, setLanCommand } },
    { "set-wan",            { 1, 1, setWanCommand } },
    { "set-backend",        { 1, 1, setBackendCommand } },
    { "set-proxy",          { 1, 2, setProxyCommand } },
    { "add-portmap",        { 4, 5, addPortMapCommand } },
    { "rm-portmap",         { 2, 2, removePortMapCommand } },
    { "refresh-portmaps",   { 1, 1, refreshPortMapsCommand } },
    { "add-acl",            { 3, 4, addAclCommand } },
    { "rm-acl",             { 3, 3, removeAclCommand } },
    { "container-deleted",  { 1, 1, containerDeletedCommand } },
    { "ipv6-native",        { 1, 1, ipv6NativeCommand } },
    { "ipv6-6in4",          { 5, 5, ipv6SixInFourCommand } },
    { "ipv6-wireguard",     { 3, 3, ipv6WireguardCommand } },
    { "ipv6-none",          { 0, 0, ipv6NoneCommand } },
};

// -----------------------------------------------------------------------------
/**
 * @brief Entrypoint
 */
int main(int argc, char *argv[])
{
    parseArgs(argc, argv);

    if (optind >= argc)
    {
        displayUsage();
        return EXIT_USAGE;
    }

    const std::string name = argv[optind];
    const Args args(argv + optind + 1, argv + argc);

    auto it = commands.find(name);
    if (it == commands.end())
    {
        fprintf(stderr, "Error: unknown command '%s'\n", name.c_str());
        displayUsage();
        return EXIT_USAGE;
    }

    const Command& command = it->second;
    if ((args.size() < command.minArgs) || (args.size() > command.maxArgs))
    {
        fprintf(stderr, "Error: wrong number of arguments for '%s'\n", name.c_str());
        displayUsage();
        return EXIT_USAGE;
    }

    QuayCommon::initLogging();

    std::shared_ptr<Settings> settings = readSettings();
    if (!settings)
    {
        QuayCommon::termLogging();
        return EXIT_USAGE;
    }

    if (!settings->logLevel().empty() && !QuayCommon::setLogLevel(settings->logLevel()))
        QUAY_LOG_WARN("invalid log level '%s' in settings", settings->logLevel().c_str());
    __quay_log_level += verbosity;

    settings->dump(QUAY_LOG_LEVEL_DEBUG);

    auto netlink = std::make_shared<Netlink>();
    if (!netlink->isValid())
    {
        QUAY_LOG_ERROR("failed to open netlink socket");
        QuayCommon::termLogging();
        return EXIT_POLICY_BASE + static_cast<int>(PolicyError::ExternalTool);
    }

    auto runner = std::make_shared<ProcessRunner>(settings->toolTimeout());
    auto runtime = std::make_shared<MachinectlRuntime>(runner, settings->toolPaths().machinectl);

    NetworkPolicyManager manager(settings, runner, runtime, netlink);

    const int ret = command.handler(manager, args);

    QuayCommon::termLogging();
    return ret;
}
