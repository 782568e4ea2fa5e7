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
#include "FakeHostTools.h"

#include <FileUtilities.h>

#include <algorithm>
#include <sstream>


namespace
{

ProcessResult exitWith(int code, const std::string& out = std::string(),
                       const std::string& err = std::string())
{
    ProcessResult result;
    result.started = true;
    result.exitCode = code;
    result.stdOut = out;
    result.stdErr = err;
    return result;
}

std::string quoteArg(const std::string& arg)
{
    if (arg.find(' ') == std::string::npos)
        return arg;
    return "\"" + arg + "\"";
}

}

ProcessResult FakeHostTools::run(const std::string& execFile,
                                 const std::list<std::string>& args,
                                 const std::string& stdinData)
{
    std::string cmdLine = execFile;
    for (const std::string& arg : args)
        cmdLine += " " + arg;
    commands.push_back(cmdLine);

    if (mFailing.count(execFile) != 0)
        return exitWith(4, std::string(), "simulated failure\n");

    if (execFile == FAKE_IPTABLES)
        return runIptables(args);
    if (execFile == FAKE_IPTABLES_SAVE)
        return exitWith(0, iptablesSave());
    if (execFile == FAKE_NFT)
        return runNft(args, stdinData);

    return exitWith(0);
}

void FakeHostTools::failTool(const std::string& execFile)
{
    mFailing.insert(execFile);
}

void FakeHostTools::healTool(const std::string& execFile)
{
    mFailing.erase(execFile);
}

void FakeHostTools::addForeignRule(const std::string& table, const std::string& chain,
                                   const std::list<std::string>& args)
{
    rules.push_back(Rule{ table, chain, args });
}

std::string FakeHostTools::iptablesSave() const
{
    std::ostringstream out;
    out << "# Generated by iptables-save v1.8.7\n";

    for (const char* table : { "filter", "nat" })
    {
        out << "*" << table << "\n";
        out << ":FORWARD DROP [0:0]\n";

        for (const Rule& rule : rules)
        {
            if (rule.table != table)
                continue;

            out << "-A " << rule.chain;
            for (const std::string& arg : rule.args)
                out << " " << quoteArg(arg);
            out << "\n";
        }

        out << "COMMIT\n";
    }

    return out.str();
}

size_t FakeHostTools::countRules(const std::string& table, const std::string& needle) const
{
    return std::count_if(rules.begin(), rules.end(),
                         [&](const Rule& rule)
                         {
                             if (rule.table != table)
                                 return false;
                             return std::find(rule.args.begin(), rule.args.end(), needle) != rule.args.end();
                         });
}

size_t FakeHostTools::ownedRuleCount() const
{
    return countRules("filter", "quay") + countRules("nat", "quay");
}

// iptables -w -t <table> <-C|-A|-D> <chain> <args...>
ProcessResult FakeHostTools::runIptables(std::list<std::string> args)
{
    if (args.size() < 5 || args.front() != "-w")
        return exitWith(2, std::string(), "bad arguments\n");
    args.pop_front();

    if (args.front() != "-t")
        return exitWith(2, std::string(), "bad arguments\n");
    args.pop_front();

    const std::string table = args.front();
    args.pop_front();
    const std::string op = args.front();
    args.pop_front();
    const std::string chain = args.front();
    args.pop_front();

    auto it = std::find_if(rules.begin(), rules.end(),
                           [&](const Rule& rule)
                           {
                               return (rule.table == table) && (rule.chain == chain) &&
                                      (rule.args == args);
                           });

    if (op == "-C")
    {
        if (it == rules.end())
            return exitWith(1, std::string(), "iptables: Bad rule (does a matching rule exist in that chain?).\n");
        return exitWith(0);
    }
    if (op == "-A")
    {
        rules.push_back(Rule{ table, chain, args });
        return exitWith(0);
    }
    if (op == "-D")
    {
        if (it == rules.end())
            return exitWith(1, std::string(), "iptables: Bad rule (does a matching rule exist in that chain?).\n");
        rules.erase(it);
        return exitWith(0);
    }

    return exitWith(2, std::string(), "unknown operation\n");
}

ProcessResult FakeHostTools::runNft(const std::list<std::string>& args,
                                    const std::string& stdinData)
{
    if (args.size() != 2 || args.front() != "-f")
        return exitWith(1, std::string(), "bad arguments\n");

    if (args.back() == "-")
    {
        if (stdinData.find("delete table") == std::string::npos)
            return exitWith(1, std::string(), "unexpected input\n");

        nftFlushes++;
        nftLoaded = false;
        nftRuleset.clear();
        return exitWith(0);
    }

    boost::optional<std::string> document = QuayCommon::readTextFile(args.back());
    if (!document)
        return exitWith(1, std::string(), "Error: Could not process rule: No such file or directory\n");

    nftLoads++;
    nftLoaded = true;
    nftRuleset = document.get();
    return exitWith(0);
}
