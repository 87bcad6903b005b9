#pragma once

#include "tfold/core/fold_view.hpp"
#include "tfold/core/message_list.hpp"
#include "tfold/core/thread_folder.hpp"

#ifndef Uses_TListViewer
#define Uses_TListViewer
#endif
#ifndef Uses_TScrollBar
#define Uses_TScrollBar
#endif
#ifndef Uses_TEvent
#define Uses_TEvent
#endif
#ifndef Uses_TKeys
#define Uses_TKeys
#endif
#include <tvision/tv.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class ThreadListView : public TListViewer
{
public:
    using NoticeCallback = std::function<void(const std::string &)>;

    ThreadListView(const TRect &bounds, TScrollBar *vScroll, tfold::core::LoadedListing &listing,
                   tfold::core::ThreadFolder &folder, const tfold::core::RegionSurface &surface);

    virtual void getText(char *dest, short item, short maxLen) override;
    virtual void handleEvent(TEvent &event) override;

    void setNoticeCallback(NoticeCallback callback) { noticeCallback = std::move(callback); }

    // Rebuilds the visible rows and focuses the row showing position.
    void refreshRows(std::optional<std::size_t> focusPosition = std::nullopt);
    std::optional<std::size_t> currentPosition() const;
    bool runCommand(ushort command);

    static ushort commandForKey(char key) noexcept;

private:
    tfold::core::LoadedListing &listing;
    tfold::core::ThreadFolder &folder;
    const tfold::core::RegionSurface &surface;
    std::vector<tfold::core::VisibleRow> rows;
    tfold::core::ThreadFolder::MarkCommand markCommand;
    NoticeCallback noticeCallback;

    void toggleMark(std::size_t position);
    void markThread(std::size_t position);
    void toggleRead(std::size_t position);
    void notice(const std::string &message);
};
