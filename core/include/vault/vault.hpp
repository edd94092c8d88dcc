#pragma once

/**
 * Bounty vault core library.
 *
 * Include this header to get the settlement framework: split arithmetic,
 * address derivation, decision authorization, routers, logging and config.
 */

#include "vault/address.hpp"
#include "vault/builder.hpp"
#include "vault/clock.hpp"
#include "vault/command_router.hpp"
#include "vault/config.hpp"
#include "vault/crypto.hpp"
#include "vault/decision.hpp"
#include "vault/errors.hpp"
#include "vault/helpers.hpp"
#include "vault/keys.hpp"
#include "vault/logging.hpp"
#include "vault/split.hpp"
#include "vault/state_router.hpp"
#include "vault/validation.hpp"
#include "vault/wire.hpp"
