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
#ifndef FAKEHOSTTOOLS_H
#define FAKEHOSTTOOLS_H

#include <IProcessRunner.h>

#include <list>
#include <set>
#include <string>
#include <vector>

#define FAKE_NFT            "/fake/sbin/nft"
#define FAKE_IPTABLES       "/fake/sbin/iptables"
#define FAKE_IPTABLES_SAVE  "/fake/sbin/iptables-save"
#define FAKE_MACHINECTL     "/fake/bin/machinectl"
#define FAKE_SYSTEMCTL      "/fake/bin/systemctl"
#define FAKE_NETWORKCTL     "/fake/bin/networkctl"

// -----------------------------------------------------------------------------
/**
 *  @class FakeHostTools
 *  @brief Stands in for the host's firewall and systemd tools.
 *
 *  iptables is modelled as an in-memory rule table that supports -C, -A and
 *  -D and can be dumped in iptables-save format.  nft just remembers the
 *  last document loaded.  Everything else is recorded and succeeds.
 */
class FakeHostTools : public IProcessRunner
{
public:
    struct Rule
    {
        std::string table;
        std::string chain;
        std::list<std::string> args;
    };

public:
    ProcessResult run(const std::string& execFile,
                      const std::list<std::string>& args,
                      const std::string& stdinData = std::string()) override;

public:
    // makes every invocation of @a execFile exit with code 4
    void failTool(const std::string& execFile);
    void healTool(const std::string& execFile);

    // adds a rule the engine doesn't own
    void addForeignRule(const std::string& table, const std::string& chain,
                        const std::list<std::string>& args);

    std::string iptablesSave() const;

    size_t countRules(const std::string& table, const std::string& needle) const;
    size_t ownedRuleCount() const;

public:
    std::vector<Rule> rules;

    bool nftLoaded = false;
    std::string nftRuleset;
    unsigned nftLoads = 0;
    unsigned nftFlushes = 0;

    std::vector<std::string> commands;

private:
    ProcessResult runIptables(std::list<std::string> args);
    ProcessResult runNft(const std::list<std::string>& args,
                         const std::string& stdinData);

    std::set<std::string> mFailing;
};

#endif // !defined(FAKEHOSTTOOLS_H)
