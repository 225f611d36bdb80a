#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <mintgate/encode.hpp>

namespace mintgate::log {

struct hex_tag
{};

/**
 * Wraps an account or other binary identity so it is copied raw onto the
 * logging queue and hex encoded by the backend thread.
 */
using hex = quill::BinaryData< hex_tag >;

} // namespace mintgate::log

template<>
struct fmtquill::formatter< mintgate::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintgate::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mintgate::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mintgate::log::hex >: quill::BinaryDataDeferredFormatCodec< mintgate::log::hex >
{};
