// DeepBook SDK - Move Function Schemas
// Declared parameter order of every on-chain entry point the SDK calls

#pragma once

#include <deepbook/transaction.hpp>

namespace deepbook::functions {

using P = ParamKind;

/* balance_manager */

inline const MoveFunction BALANCE_MANAGER_NEW{"balance_manager", "new", {}, 0};

// <T>(manager, coin)
inline const MoveFunction DEPOSIT{"balance_manager", "deposit", {P::Object, P::Result}, 1};

// <T>(manager, amount) -> Coin<T>
inline const MoveFunction WITHDRAW{"balance_manager", "withdraw", {P::Object, P::Pure}, 1};

inline const MoveFunction WITHDRAW_ALL{"balance_manager", "withdraw_all", {P::Object}, 1};

inline const MoveFunction BALANCE{"balance_manager", "balance", {P::Object}, 1};

inline const MoveFunction GENERATE_PROOF_AS_OWNER{
    "balance_manager", "generate_proof_as_owner", {P::Object}, 0};

// (manager, trade_cap)
inline const MoveFunction GENERATE_PROOF_AS_TRADER{
    "balance_manager", "generate_proof_as_trader", {P::Object, P::Object}, 0};

inline const MoveFunction OWNER{"balance_manager", "owner", {P::Object}, 0};

inline const MoveFunction ID{"balance_manager", "id", {P::Object}, 0};

inline const MoveFunction MINT_TRADE_CAP{"balance_manager", "mint_trade_cap", {P::Object}, 0};

/* transfer (framework) */

inline const MoveFunction PUBLIC_SHARE_OBJECT{"transfer", "public_share_object", {P::Result}, 1};

/* pool, all generic over <Base, Quote> */

// (pool, manager, proof, client_order_id, order_type, self_matching_option,
//  price, quantity, is_bid, pay_with_deep, expire_timestamp, clock)
inline const MoveFunction PLACE_LIMIT_ORDER{
    "pool", "place_limit_order",
    {P::Object, P::Object, P::Result, P::Pure, P::Pure, P::Pure,
     P::Pure, P::Pure, P::Pure, P::Pure, P::Pure, P::Object},
    2};

// (pool, manager, proof, client_order_id, self_matching_option,
//  quantity, is_bid, pay_with_deep, clock)
inline const MoveFunction PLACE_MARKET_ORDER{
    "pool", "place_market_order",
    {P::Object, P::Object, P::Result, P::Pure, P::Pure,
     P::Pure, P::Pure, P::Pure, P::Object},
    2};

// (pool, manager, proof, order_id, new_quantity, clock)
inline const MoveFunction MODIFY_ORDER{
    "pool", "modify_order",
    {P::Object, P::Object, P::Result, P::Pure, P::Pure, P::Object}, 2};

// (pool, manager, proof, order_id, clock)
inline const MoveFunction CANCEL_ORDER{
    "pool", "cancel_order",
    {P::Object, P::Object, P::Result, P::Pure, P::Object}, 2};

inline const MoveFunction CANCEL_ALL_ORDERS{
    "pool", "cancel_all_orders",
    {P::Object, P::Object, P::Result, P::Object}, 2};

inline const MoveFunction WITHDRAW_SETTLED_AMOUNTS{
    "pool", "withdraw_settled_amounts",
    {P::Object, P::Object, P::Result}, 2};

// (pool, manager) -> VecSet<u128>
inline const MoveFunction ACCOUNT_OPEN_ORDERS{
    "pool", "account_open_orders", {P::Object, P::Object}, 2};

inline const MoveFunction WHITELISTED{"pool", "whitelisted", {P::Object}, 2};

// (pool, clock) -> u64
inline const MoveFunction MID_PRICE{"pool", "mid_price", {P::Object, P::Object}, 2};

}  // namespace deepbook::functions
