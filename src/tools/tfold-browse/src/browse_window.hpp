#pragma once

#include "thread_list_view.hpp"

#include "tfold/core/fold_region.hpp"
#include "tfold/core/fold_session.hpp"
#include "tfold/core/message_list.hpp"
#include "tfold/core/thread_folder.hpp"

#ifndef Uses_TWindow
#define Uses_TWindow
#endif
#ifndef Uses_TView
#define Uses_TView
#endif
#ifndef Uses_TDrawBuffer
#define Uses_TDrawBuffer
#endif
#include <tvision/tv.h>

#include <filesystem>
#include <string>

class NoticeView : public TView
{
public:
    explicit NoticeView(const TRect &bounds);

    virtual void draw() override;
    void setText(std::string message);

private:
    std::string text;
};

class BrowseWindow : public TWindow
{
public:
    BrowseWindow(const TRect &bounds, std::filesystem::path path, tfold::core::LoadedListing loaded,
                 const tfold::core::FolderSettings &settings, bool foldedByDefault);

    virtual void handleEvent(TEvent &event) override;

    bool reload();
    void applySettings(const tfold::core::FolderSettings &settings);

private:
    std::filesystem::path path;
    tfold::core::LoadedListing listing;
    tfold::core::MemoryRegionSurface surface;
    tfold::core::FoldSession session;
    tfold::core::ThreadFolder folder;
    ThreadListView *listView = nullptr;
    NoticeView *noticeView = nullptr;

    void showNotice(const std::string &message);
};
