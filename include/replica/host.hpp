#pragma once

#include <replica/core.hpp>
#include <replica/detail/authority_impl.hpp>
#include <replica/detail/follower_impl.hpp>

namespace replica
{

template <StateProgramFactory Factory, typename CallablePolicy = policy::copy>
using Authority = AuthorityImpl<Factory, CallablePolicy>;

template <StateProgramFactory Factory>
using Follower = FollowerImpl<Factory>;

} // namespace replica
