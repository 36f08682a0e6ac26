#include <coffer/ledger/transaction.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace coffer::ledger {

namespace {

using encoder_t = coffer::schema::encoding::encoder<
    coffer::schema::encoding::scale_encoder_tag>;
using encoded_meta_t = std::tuple<coffer::schema::address_t, bool, bool>;
using encoded_instruction_t = std::tuple<coffer::schema::address_t,
                                         std::vector<encoded_meta_t>,
                                         coffer::schema::bytes_t>;

}  // namespace

coffer::schema::bytes_t serialize_message(const message_t& message) {
  auto instructions = std::vector<encoded_instruction_t>{};
  instructions.reserve(message.instructions.size());
  for (const auto& instruction : message.instructions) {
    auto metas = std::vector<encoded_meta_t>{};
    metas.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts) {
      metas.emplace_back(meta.key, meta.is_signer, meta.is_writable);
    }
    instructions.emplace_back(instruction.program_id, std::move(metas),
                              instruction.data);
  }

  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{message.fee_payer,
                                   message.recent_blockhash, instructions});
}

}  // namespace coffer::ledger
