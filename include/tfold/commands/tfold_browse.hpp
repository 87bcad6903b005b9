#pragma once

#include <cstdint>

namespace tfold::commands::browse
{

inline constexpr std::uint16_t FoldThread = 6000;
inline constexpr std::uint16_t UnfoldThread = 6001;
inline constexpr std::uint16_t ToggleThread = 6002;
inline constexpr std::uint16_t ToggleAndAdvance = 6003;
inline constexpr std::uint16_t FoldAll = 6004;
inline constexpr std::uint16_t UnfoldAll = 6005;
inline constexpr std::uint16_t ToggleAll = 6006;
inline constexpr std::uint16_t ApplyAll = 6007;
inline constexpr std::uint16_t ThreadRoot = 6010;
inline constexpr std::uint16_t PreviousThread = 6011;
inline constexpr std::uint16_t NextThread = 6012;
inline constexpr std::uint16_t MarkMessage = 6020;
inline constexpr std::uint16_t MarkThread = 6021;
inline constexpr std::uint16_t ToggleRead = 6022;
inline constexpr std::uint16_t ReloadListing = 6030;
inline constexpr std::uint16_t SaveDefaults = 6031;
inline constexpr std::uint16_t ToggleFoldUnread = 6032;

} // namespace tfold::commands::browse
