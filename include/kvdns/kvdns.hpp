// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "network/dns/dns_codec.hpp"
#include "network/dns/dns_resolver.hpp"
#include "network/dns/dns_server.hpp"
#include "network/dns/dns_types.hpp"
#include "network/ip_utils.hpp"
#include "parsers/minimal_toml.hpp"
#include "storage/key_lookup.hpp"
#include "storage/redis_key_lookup.hpp"
