#pragma once

#include <cstddef>

namespace walletmask::strat
{

///
/// @brief      Hands every line the reader gives to the handler in the calling thread
///
/// @param[in]  reader   A functor-like object called to receive a line until
///                      it is exhausted, what it is checked by calling operator bool()
/// @param[in]  handler  A functor-like object called with the 0-based line index and the line
///
/// @return     The number of lines read
///
/// @details    The reader is taken by reference when given an lvalue, so the caller
///             may look at its state while handling a line
///
template <typename LineReader, typename LineHandler>
size_t sequential(LineReader &&reader, LineHandler handler)
{
    size_t line_idx = 0;
    for (auto line = reader(); reader; ++line_idx, line = reader())
        handler(line_idx, line);
    return line_idx;
}

} // namespace walletmask::strat
