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
 * File:   NftablesBackend.h
 *
 */
#ifndef NFTABLESBACKEND_H
#define NFTABLESBACKEND_H

#include "IFirewallBackend.h"

#include <memory>

class IProcessRunner;


// -----------------------------------------------------------------------------
/**
 *  @class NftablesBackend
 *  @brief Atomic backend, the whole ruleset is replaced in one transaction.
 *
 *  The rendered document is written to a well-known path and then loaded
 *  with 'nft -f', nft guarantees the load either completely succeeds or
 *  leaves the previous ruleset in place.
 */
class NftablesBackend : public IFirewallBackend
{
public:
    NftablesBackend(const std::shared_ptr<IProcessRunner>& runner,
                    const std::string& nftPath,
                    const std::string& rulesetPath);
    ~NftablesBackend() override = default;

public:
    NatBackend type() const override;
    std::string render(const PolicyState& state) const override;
    PolicyResult apply(const PolicyState& desired,
                       const PolicyState* previous) override;
    PolicyResult flush() override;

private:
    const std::shared_ptr<IProcessRunner> mRunner;
    const std::string mNftPath;
    const std::string mRulesetPath;
};

#endif // !defined(NFTABLESBACKEND_H)
