#pragma once

#include "warden/c_api/wdn_api.h"
#include "warden/interfaces/i_wallet_engine.hpp"

#include <memory>

// C++ side of the C ABI. A native embedder attaches its wallet engines here
// before handing the runtime to a foreign host, which then addresses them by
// the returned handle.

/**
 * @brief Register a wallet engine with the runtime
 *
 * The engine receives its event emitter before the handle is returned.
 */
WDN_API WdnErrorCode wdn_wallet_attach(
    WdnRuntime* runtime,
    std::shared_ptr<warden::interfaces::IWalletEngine> engine,
    WdnHandle* out_handle,
    WdnError* out_error);
