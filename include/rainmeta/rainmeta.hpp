// ====================================================================================
// RAINMETA - Rain Meta Document Format & Content Addressed Store
//
// Umbrella header for the whole library.
// ====================================================================================

#ifndef RAINMETA_RAINMETA_HPP_
#define RAINMETA_RAINMETA_HPP_

#include "rainmeta/status.hpp"
#include "rainmeta/logging.hpp"
#include "rainmeta/config.hpp"
#include "rainmeta/crypto.hpp"
#include "rainmeta/magic.hpp"
#include "rainmeta/content.hpp"
#include "rainmeta/cbor.hpp"
#include "rainmeta/document.hpp"
#include "rainmeta/abi.hpp"
#include "rainmeta/types.hpp"
#include "rainmeta/typed_meta.hpp"
#include "rainmeta/resolver.hpp"
#include "rainmeta/store.hpp"
#include "rainmeta/deployment.hpp"

#endif  // RAINMETA_RAINMETA_HPP_
