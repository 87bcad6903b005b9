#pragma once

#include "tfold/core/thread_folder.hpp"
#include "tfold/options.hpp"

#include <string>

namespace tfold::core
{

inline constexpr const char *kOptionFoldUnread = "foldUnread";
inline constexpr const char *kOptionFoldedByDefault = "foldedByDefault";
inline constexpr const char *kOptionSummaryFormat = "summaryFormat";
inline constexpr const char *kOptionRootStyle = "rootStyle";
inline constexpr const char *kOptionLogLevel = "logLevel";

void registerFoldOptions(config::OptionRegistry &registry);

FolderSettings foldSettingsFrom(const config::OptionRegistry &registry);
bool foldedByDefaultFrom(const config::OptionRegistry &registry);

} // namespace tfold::core
