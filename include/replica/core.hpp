#pragma once

#include <replica/detail/concepts.hpp>
#include <replica/detail/factory.hpp>
#include <replica/detail/helpers.hpp>
#include <replica/detail/policy.hpp>
#include <replica/detail/program.hpp>
#include <replica/detail/types.hpp>
