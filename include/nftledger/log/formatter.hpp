#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/std/Vector.h>

#include <nftledger/encode/hex.hpp>

namespace nftledger::log {

struct hex_tag
{};

/**
 * Binary data logged as lowercase hex, used for accounts.
 */
using hex = quill::BinaryData< hex_tag >;

} // namespace nftledger::log

template<>
struct fmtquill::formatter< nftledger::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const nftledger::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                nftledger::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< nftledger::log::hex >: quill::BinaryDataDeferredFormatCodec< nftledger::log::hex >
{};
