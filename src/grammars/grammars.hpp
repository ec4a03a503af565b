#pragma once

#include "detect/match.hpp"

#include "grammars/ens_grammar.hpp"
#include "grammars/grammar.hpp"
#include "grammars/truncated_grammar.hpp"
#include "grammars/word_grammar.hpp"

namespace walletmask::grammars
{

// full forms

using EvmAddress     = WordGrammar<Family::EvmAddress,     prefix::Hex,        alphabet::Hex,    40, 40>;
using EvmTxHash      = WordGrammar<Family::EvmTxHash,      prefix::Hex,        alphabet::Hex,    64, 64>;
using BtcTxId        = WordGrammar<Family::BtcTxId,        prefix::None,       alphabet::Hex,    64, 64>;
using BtcLegacy      = WordGrammar<Family::BtcLegacy,      prefix::BtcVersion, alphabet::Base58, 25, 34, shape::NotAllHex>;
using BtcSegwit      = WordGrammar<Family::BtcSegwit,      prefix::Segwit,     alphabet::Bech32, 11, 71, shape::SingleCase>;
using SolAddress     = WordGrammar<Family::SolAddress,     prefix::None,       alphabet::Base58, 32, 44, shape::Scrambled>;
using SolTxSignature = WordGrammar<Family::SolTxSignature, prefix::None,       alphabet::Base58, 86, 88, shape::Scrambled>;
using EnsName        = EnsGrammar;

// elided forms

using EvmTruncated = TruncatedGrammar<
    Fragment<prefix::Hex, alphabet::Hex, 3, 12>,
    Fragment<prefix::None, alphabet::Hex, 3, 12>>;

using BtcTxTruncated = TruncatedGrammar<
    Fragment<prefix::None, alphabet::Hex, 4, 12>,
    Fragment<prefix::None, alphabet::Hex, 4, 12>,
    plausible::HexLetters>;

using BtcLegacyTruncated = TruncatedGrammar<
    Fragment<prefix::BtcVersion, alphabet::Base58, 2, 20>,
    Fragment<prefix::None, alphabet::Base58, 2, 20>,
    plausible::NotDecimal>;

using BtcSegwitTruncated = TruncatedGrammar<
    Fragment<prefix::Segwit, alphabet::Bech32, 2, 40>,
    Fragment<prefix::None, alphabet::Bech32, 2, 40>>;

using SolTruncated = TruncatedGrammar<
    Fragment<prefix::None, alphabet::Base58, 3, 12>,
    Fragment<prefix::None, alphabet::Base58, 3, 12>,
    plausible::Encoded>;

} // namespace walletmask::grammars
