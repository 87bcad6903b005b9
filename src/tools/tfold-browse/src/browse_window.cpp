#include "browse_window.hpp"

#include "command_ids.hpp"

#include "tfold/logging.hpp"

NoticeView::NoticeView(const TRect &bounds)
    : TView(bounds)
{
    options &= ~(ofSelectable | ofFirstClick);
    growMode = gfGrowLoY | gfGrowHiX | gfGrowHiY;
}

void NoticeView::draw()
{
    TDrawBuffer buffer;
    TColorAttr color = getColor(1);
    buffer.moveChar(0, ' ', color, size.x);
    buffer.moveStr(1, text.c_str(), color);
    writeLine(0, 0, size.x, 1, buffer);
}

void NoticeView::setText(std::string message)
{
    text = std::move(message);
    drawView();
}

BrowseWindow::BrowseWindow(const TRect &bounds, std::filesystem::path sourcePath, tfold::core::LoadedListing loaded,
                           const tfold::core::FolderSettings &settings, bool foldedByDefault)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, sourcePath.filename().string().c_str(), wnNoNumber),
      path(std::move(sourcePath)), listing(std::move(loaded)), session(foldedByDefault),
      folder(listing.messages, surface, session, settings)
{
    options |= ofTileable;

    folder.setMarkQuery(listing.marks.query());
    folder.setNoticeCallback([this](const std::string &message) { showNotice(message); });

    TRect inner = getExtent();
    inner.grow(-1, -1);

    TRect scrollRect(inner.b.x - 1, inner.a.y, inner.b.x, inner.b.y - 1);
    auto *vScroll = new TScrollBar(scrollRect);
    insert(vScroll);

    TRect noticeRect(inner.a.x, inner.b.y - 1, inner.b.x, inner.b.y);
    noticeView = new NoticeView(noticeRect);
    insert(noticeView);

    // Bring the new listing in line with the session before the first draw.
    folder.applyAll();

    TRect listRect(inner.a.x, inner.a.y, inner.b.x - 1, inner.b.y - 1);
    listView = new ThreadListView(listRect, vScroll, listing, folder, surface);
    listView->growMode = gfGrowHiX | gfGrowHiY;
    listView->setNoticeCallback([this](const std::string &message) { showNotice(message); });
    insert(listView);
    listView->select();
}

void BrowseWindow::handleEvent(TEvent &event)
{
    if (event.what == evCommand && event.message.command == cmReloadListing)
    {
        if (reload())
            showNotice("Listing reloaded");
        clearEvent(event);
        return;
    }
    TWindow::handleEvent(event);
}

bool BrowseWindow::reload()
{
    std::string error;
    auto loaded = tfold::core::loadMessageList(path, &error);
    if (!loaded)
    {
        showNotice("Cannot reload " + path.filename().string() + ": " + error);
        return false;
    }
    std::string focusId;
    if (auto focus = listView->currentPosition())
    {
        if (const auto *message = listing.messages.messageAt(*focus))
            focusId = message->id;
    }
    listing.messages = std::move(loaded->messages);
    listing.marks = std::move(loaded->marks);
    // Fold regions belong to the old line positions.
    surface.clear();
    folder.applyAll();
    std::optional<std::size_t> focus;
    if (!focusId.empty())
        focus = listing.messages.findMessage(focusId);
    listView->refreshRows(focus.value_or(0));
    return true;
}

void BrowseWindow::applySettings(const tfold::core::FolderSettings &settings)
{
    const auto focus = listView->currentPosition();
    folder.applySettings(settings);
    showNotice(settings.foldUnread ? "Unread messages may be folded" : "Unread messages stay visible");
    surface.clear();
    folder.applyAll();
    listView->refreshRows(focus.value_or(0));
}

void BrowseWindow::showNotice(const std::string &message)
{
    tfold::logging::logger()->debug("Notice: {}", message);
    if (noticeView)
        noticeView->setText(message);
}
