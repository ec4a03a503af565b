#pragma once

namespace walletmask::test
{

// a page of 25 lines, the last one is terminated by a line feed
constexpr char kSamplePage[] = R"page(Wallet Mask sample page
=======================

Donations are welcome at 0xAb5801a7D398351b8bE11C439e05C5B3259aeC9B or vitalik.eth, thank you!
The genesis coinbase paid 1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa fifty coins.

Recent activity:
  - received 0.5 BTC at bc1qar0srrr7xfkvy5l643lydnw9re59gtzzwf5mdq (confirmed)
  - tx f4184fc596403b9d638783cf57adfe4c75c605f6356fbc91338530e9831e9e16
  - swap 0x88df016429689c079f3b2f6ad39fa052532c56795b733da78a91ebe6a713944b pending

Solana
------
Staking account 7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU earns 6.8% APY.
Signature: 5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW

Leaderboard: 0x71C7…976F, 7xKX...gAsU, bc1qar...5mdq and 1A1z...vfNa.
Wait...What? The years 1990...2000 were wild, the total was 12345678901234567890.
Plain hex like deadbeefdeadbeefdeadbeef is not an identifier.
Платёж отправлен на 0x1234567890123456789012345678901234567890, спасибо!
Lorem ipsum dolor sit amet, consectetur adipiscing elit.
Sed do eiusmod tempor incididunt ut labore et dolore magna aliqua.

Ut enim ad minim veniam, quis nostrud exercitation ullamco laboris.
P2SH multisig 3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy and pay.vitalik.eth.
)page";

} // namespace walletmask::test
