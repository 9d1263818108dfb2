#pragma once

// Primary public header for the netaddr IP address library.
// Most users should include this header only.

// Error & result model
#include <netaddr/error.hpp>
#include <netaddr/expected.hpp>
#include <netaddr/result.hpp>

// Value types
#include <netaddr/address.hpp>
#include <netaddr/address_port.hpp>
#include <netaddr/address_prefix.hpp>
