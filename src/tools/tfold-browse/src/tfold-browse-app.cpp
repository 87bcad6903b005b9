#include "browse_window.hpp"
#include "command_ids.hpp"

#include "tfold/core/fold_options.hpp"
#include "tfold/core/fold_region.hpp"
#include "tfold/core/fold_session.hpp"
#include "tfold/core/fold_view.hpp"
#include "tfold/core/message_list.hpp"
#include "tfold/core/thread_folder.hpp"
#include "tfold/logging.hpp"
#include "tfold/options.hpp"

#define Uses_MsgBox
#define Uses_TApplication
#define Uses_TDeskTop
#define Uses_TKeys
#define Uses_TMenu
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TProgram
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TStatusLine
#define Uses_TSubMenu
#include <tvision/tv.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace
{

constexpr std::string_view kAppId = "tfold-browse";

class BrowseApp : public TApplication
{
public:
    BrowseApp(tfold::config::OptionRegistry &registry, std::filesystem::path path, tfold::core::LoadedListing listing)
        : TProgInit(&BrowseApp::initStatusLine, &BrowseApp::initMenuBar, &TApplication::initDeskTop),
          registry(registry)
    {
        TRect bounds = deskTop->getExtent();
        window = new BrowseWindow(bounds, std::move(path), std::move(listing),
                                  tfold::core::foldSettingsFrom(registry),
                                  tfold::core::foldedByDefaultFrom(registry));
        deskTop->insert(window);
    }

    void handleEvent(TEvent &event) override
    {
        TApplication::handleEvent(event);
        if (event.what == evCommand)
        {
            switch (event.message.command)
            {
            case cmSaveDefaults:
                saveDefaults();
                break;
            case cmToggleFoldUnread:
                toggleFoldUnread();
                break;
            default:
                return;
            }
            clearEvent(event);
        }
    }

    static TMenuBar *initMenuBar(TRect r)
    {
        r.b.y = r.a.y + 1;
        TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                             *new TMenuItem("~R~eload Listing", cmReloadListing, kbCtrlR, hcNoContext, "Ctrl-R") +
                             *new TMenuItem("Fold ~U~nread On/Off", cmToggleFoldUnread, kbNoKey, hcNoContext) +
                             *new TMenuItem("~S~ave Options as Defaults", cmSaveDefaults, kbNoKey, hcNoContext) +
                             newLine() +
                             *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");

        TSubMenu &threadMenu = *new TSubMenu("~T~hread", hcNoContext) +
                               *new TMenuItem("~F~old", cmFoldThread, kbNoKey, hcNoContext, "f") +
                               *new TMenuItem("~U~nfold", cmUnfoldThread, kbNoKey, hcNoContext, "u") +
                               *new TMenuItem("~T~oggle", cmToggleThread, kbF2, hcNoContext, "F2") +
                               *new TMenuItem("Toggle and ~A~dvance", cmToggleAndAdvance, kbNoKey, hcNoContext, "a") +
                               newLine() +
                               *new TMenuItem("Go to ~R~oot", cmThreadRoot, kbNoKey, hcNoContext, "r") +
                               *new TMenuItem("~P~revious Thread", cmPreviousThread, kbNoKey, hcNoContext, "p") +
                               *new TMenuItem("~N~ext Thread", cmNextThread, kbNoKey, hcNoContext, "n");

        TSubMenu &allMenu = *new TSubMenu("~A~ll", hcNoContext) +
                            *new TMenuItem("~F~old All", cmFoldAll, kbF3, hcNoContext, "F3") +
                            *new TMenuItem("~U~nfold All", cmUnfoldAll, kbF4, hcNoContext, "F4") +
                            *new TMenuItem("~T~oggle All", cmToggleAll, kbNoKey, hcNoContext, "T") +
                            *new TMenuItem("~A~pply Defaults", cmApplyAll, kbF5, hcNoContext, "F5");

        TSubMenu &markMenu = *new TSubMenu("~M~ark", hcNoContext) +
                             *new TMenuItem("Mark ~M~essage", cmMarkMessage, kbNoKey, hcNoContext, "m") +
                             *new TMenuItem("Mark ~T~hread", cmMarkThread, kbNoKey, hcNoContext, "M") +
                             newLine() +
                             *new TMenuItem("Toggle ~R~ead", cmToggleRead, kbNoKey, hcNoContext, "o");

        TMenuItem &menuChain = fileMenu + threadMenu + allMenu + markMenu;
        return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
    }

    static TStatusLine *initStatusLine(TRect r)
    {
        r.a.y = r.b.y - 1;
        return new TStatusLine(r, *new TStatusDef(0, 0xFFFF) +
                                      *new TStatusItem("~F2~ Toggle", kbF2, cmToggleThread) +
                                      *new TStatusItem("~F3~ Fold All", kbF3, cmFoldAll) +
                                      *new TStatusItem("~F4~ Unfold All", kbF4, cmUnfoldAll) +
                                      *new TStatusItem("~F5~ Apply", kbF5, cmApplyAll) +
                                      *new TStatusItem("~Ctrl-R~ Reload", kbCtrlR, cmReloadListing) +
                                      *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit));
    }

private:
    tfold::config::OptionRegistry &registry;
    BrowseWindow *window = nullptr;

    void toggleFoldUnread()
    {
        const bool enabled = !registry.getBool(tfold::core::kOptionFoldUnread);
        registry.set(tfold::core::kOptionFoldUnread, tfold::config::OptionValue(enabled));
        window->applySettings(tfold::core::foldSettingsFrom(registry));
    }

    void saveDefaults()
    {
        if (registry.saveDefaults())
        {
            std::string message = "Options saved to " + registry.defaultOptionsPath().string();
            messageBox(message.c_str(), mfInformation | mfOKButton);
        }
        else
        {
            messageBox("Could not save the options file.", mfError | mfOKButton);
        }
    }
};

int dumpListing(const std::filesystem::path &path, const tfold::config::OptionRegistry &registry)
{
    std::string error;
    auto listing = tfold::core::loadMessageList(path, &error);
    if (!listing)
    {
        std::fprintf(stderr, "Cannot read %s: %s\n", path.string().c_str(), error.c_str());
        return EXIT_FAILURE;
    }

    tfold::core::MemoryRegionSurface surface;
    tfold::core::FoldSession session(tfold::core::foldedByDefaultFrom(registry));
    tfold::core::ThreadFolder folder(listing->messages, surface, session, tfold::core::foldSettingsFrom(registry));
    folder.setMarkQuery(listing->marks.query());
    folder.applyAll();

    for (const auto &row : tfold::core::visibleRows(listing->messages, surface))
        std::cout << tfold::core::renderRow(listing->messages, row) << '\n';
    std::cout.flush();
    return std::cout ? EXIT_SUCCESS : EXIT_FAILURE;
}

void printUsage(const char *binaryName, const tfold::config::OptionRegistry &registry)
{
    std::printf("Usage: %s [options] LISTING.json\n"
                "  --dump              print the folded listing and exit\n"
                "  --fold-unread       allow unread messages to be folded\n"
                "  --folded            open with every thread folded\n"
                "  --log-level LEVEL   trace, debug, info, warn, error, critical or off\n"
                "  --log-file PATH     write the log to PATH\n"
                "  --save-defaults     store the effective options and exit\n",
                binaryName);

    std::printf("\nOptions (%s):\n", registry.defaultOptionsPath().string().c_str());
    for (const auto &definition : registry.listRegisteredOptions())
    {
        const std::string current = registry.get(definition.key).toString();
        std::printf("  %-16s %s [%s]\n", definition.key.c_str(), definition.description.c_str(), current.c_str());
    }
}

} // namespace

int main(int argc, char **argv)
{
    tfold::config::OptionRegistry registry{std::string(kAppId)};
    tfold::core::registerFoldOptions(registry);
    const bool loadedDefaults = registry.loadDefaults();

    bool dump = false;
    bool saveOnly = false;
    std::optional<std::filesystem::path> listingPath;
    tfold::logging::LogSettings logSettings;
    logSettings.file = tfold::config::OptionRegistry::configRoot() / std::string(kAppId) / "tfold-browse.log";

    const char *binaryName = (argc > 0 && argv[0]) ? argv[0] : "tfold-browse";
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--dump")
        {
            dump = true;
        }
        else if (arg == "--fold-unread")
        {
            registry.set(tfold::core::kOptionFoldUnread, tfold::config::OptionValue(true));
        }
        else if (arg == "--folded")
        {
            registry.set(tfold::core::kOptionFoldedByDefault, tfold::config::OptionValue(true));
        }
        else if (arg == "--log-level" || arg == "--log-file")
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "%s requires a value.\n", argv[i]);
                return EXIT_FAILURE;
            }
            if (arg == "--log-level")
                registry.set(tfold::core::kOptionLogLevel, tfold::config::OptionValue(argv[++i]));
            else
                logSettings.file = argv[++i];
        }
        else if (arg == "--save-defaults")
        {
            saveOnly = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(binaryName, registry);
            return 0;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            std::fprintf(stderr, "Unknown option %s\n", argv[i]);
            return EXIT_FAILURE;
        }
        else
        {
            listingPath = std::filesystem::path(arg);
        }
    }

    logSettings.level = registry.getString(tfold::core::kOptionLogLevel, "warn");
    if (dump)
        logSettings.toStderr = true;
    if (!tfold::logging::initialize(logSettings))
        std::fprintf(stderr, "Logging disabled: cannot open %s\n", logSettings.file.string().c_str());
    if (!loadedDefaults)
        tfold::logging::logger()->debug("No stored defaults at {}", registry.defaultOptionsPath().string());

    if (saveOnly)
    {
        if (!registry.saveDefaults())
        {
            std::fprintf(stderr, "Cannot write %s\n", registry.defaultOptionsPath().string().c_str());
            return EXIT_FAILURE;
        }
        std::printf("%s\n", registry.defaultOptionsPath().string().c_str());
        return 0;
    }

    if (!listingPath)
    {
        printUsage(binaryName, registry);
        return EXIT_FAILURE;
    }

    if (dump)
    {
        int code = dumpListing(*listingPath, registry);
        tfold::logging::shutdown();
        return code;
    }

    std::string error;
    auto listing = tfold::core::loadMessageList(*listingPath, &error);
    if (!listing)
    {
        std::fprintf(stderr, "Cannot read %s: %s\n", listingPath->string().c_str(), error.c_str());
        return EXIT_FAILURE;
    }

    BrowseApp app(registry, *listingPath, std::move(*listing));
    app.run();
    app.shutDown();
    tfold::logging::shutdown();
    return 0;
}
