#pragma once

#include <cstddef>

#include <ostream>
#include <string>
#include <tuple>
#include <vector>

#include <boost/utility/string_view.hpp>

namespace walletmask
{

///
/// @brief      Identifier families the detector recognizes
///
/// @details    Elided forms of every family share the Truncated tag
///
enum class Family
{
    EvmAddress,
    EvmTxHash,
    EnsName,
    BtcLegacy,
    BtcSegwit,
    BtcTxId,
    SolAddress,
    SolTxSignature,
    Truncated,
};

inline boost::string_view to_string(Family family) noexcept
{
    switch (family)
    {
        case Family::EvmAddress:     return "evm_address";
        case Family::EvmTxHash:      return "evm_tx_hash";
        case Family::EnsName:        return "ens_name";
        case Family::BtcLegacy:      return "btc_legacy";
        case Family::BtcSegwit:      return "btc_segwit";
        case Family::BtcTxId:        return "btc_tx_id";
        case Family::SolAddress:     return "sol_address";
        case Family::SolTxSignature: return "sol_tx_signature";
        case Family::Truncated:      return "truncated";
    }
    return "unknown";
}

inline std::ostream &operator<<(std::ostream &os, Family family) { return os << to_string(family); }

///
/// @brief      A detected identifier
///
struct Match
{
    size_t      index = 0;  // position of the first character, in code points
    std::string value;      // exact bytes of the identifier
    Family      family = Family::Truncated;
    size_t      offset = 0; // position of the first byte
};

inline bool operator==(Match const &lhs, Match const &rhs) noexcept
{
    return std::tie(lhs.index, lhs.value, lhs.family, lhs.offset) ==
           std::tie(rhs.index, rhs.value, rhs.family, rhs.offset);
}

inline bool operator!=(Match const &lhs, Match const &rhs) noexcept { return !(lhs == rhs); }

inline std::ostream &operator<<(std::ostream &os, Match const &match)
{
    return os << match.index << ' ' << match.family << ' ' << match.value;
}

///
/// @brief      Matches ordered by index, pairwise disjoint
///
using MatchList = std::vector<Match>;

} // namespace walletmask
