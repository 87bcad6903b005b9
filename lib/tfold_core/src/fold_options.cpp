#include "tfold/core/fold_options.hpp"

namespace tfold::core
{

void registerFoldOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionFoldUnread, config::OptionKind::Boolean, config::OptionValue(false),
                             "Fold Unread Messages",
                             "Allow unread messages to be hidden inside a folded thread."});
    registry.registerOption({kOptionFoldedByDefault, config::OptionKind::Boolean, config::OptionValue(false),
                             "Fold Threads by Default",
                             "Show every thread folded when a listing is opened."});
    registry.registerOption({kOptionSummaryFormat, config::OptionKind::String,
                             config::OptionValue(std::string(kDefaultSummaryFormat)), "Summary Format",
                             "Text shown for a folded thread; {hidden} and {unread} are replaced."});
    registry.registerOption({kOptionRootStyle, config::OptionKind::String,
                             config::OptionValue(std::string(kDefaultRootStyle)), "Root Line Style",
                             "Style name applied to the root line of a folded thread."});
    registry.registerOption({kOptionLogLevel, config::OptionKind::String, config::OptionValue("warn"),
                             "Log Level", "One of trace, debug, info, warn, error, critical or off."});
}

FolderSettings foldSettingsFrom(const config::OptionRegistry &registry)
{
    FolderSettings settings;
    settings.foldUnread = registry.getBool(kOptionFoldUnread, false);
    settings.summaryFormat = registry.getString(kOptionSummaryFormat, std::string(kDefaultSummaryFormat));
    if (settings.summaryFormat.empty())
        settings.summaryFormat = std::string(kDefaultSummaryFormat);
    settings.rootStyle = registry.getString(kOptionRootStyle, std::string(kDefaultRootStyle));
    return settings;
}

bool foldedByDefaultFrom(const config::OptionRegistry &registry)
{
    return registry.getBool(kOptionFoldedByDefault, false);
}

} // namespace tfold::core
