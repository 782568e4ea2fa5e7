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
/*
 * File:   IptablesBackend.h
 *
 */
#ifndef IPTABLESBACKEND_H
#define IPTABLESBACKEND_H

#include "IFirewallBackend.h"
#include "IProcessRunner.h"
#include "RuleRenderer.h"

#include <list>
#include <memory>


// -----------------------------------------------------------------------------
/**
 *  @class IptablesBackend
 *  @brief Additive backend, rules are inserted and removed one at a time.
 *
 *  iptables has no notion of reconciling to a desired state so every rule is
 *  applied as check-then-append, and stale rules as check-then-delete.  This
 *  makes applying the same state any number of times converge on the same
 *  installed rules.
 *
 *  Only IPv4 is handled; IPv6 ACLs are not enforced by this backend.
 */
class IptablesBackend : public IFirewallBackend
{
public:
    IptablesBackend(const std::shared_ptr<IProcessRunner>& runner,
                    const std::string& iptablesPath,
                    const std::string& iptablesSavePath);
    ~IptablesBackend() override = default;

public:
    NatBackend type() const override;
    std::string render(const PolicyState& state) const override;
    PolicyResult apply(const PolicyState& desired,
                       const PolicyState* previous) override;
    PolicyResult flush() override;

public:
    static std::list<IptablesRule> parseOwnedRules(const std::string& saveOutput);

private:
    enum class RuleState { Present, Absent, Error };
    RuleState checkRule(const IptablesRule& rule, std::string* diagnostic);

    PolicyResult appendIfAbsent(const IptablesRule& rule);
    PolicyResult deleteIfPresent(const IptablesRule& rule);

    ProcessResult runIptables(const char* operation, const IptablesRule& rule);

    static std::list<std::string> splitRuleLine(const std::string& line);

private:
    const std::shared_ptr<IProcessRunner> mRunner;
    const std::string mIptablesPath;
    const std::string mIptablesSavePath;
};

#endif // !defined(IPTABLESBACKEND_H)
