#include "thread_list_view.hpp"

#include "command_ids.hpp"

#include <algorithm>
#include <cstdio>

using tfold::core::Message;

ThreadListView::ThreadListView(const TRect &bounds, TScrollBar *vScroll, tfold::core::LoadedListing &listing,
                               tfold::core::ThreadFolder &folder, const tfold::core::RegionSurface &surface)
    : TListViewer(bounds, 1, nullptr, vScroll), listing(listing), folder(folder), surface(surface)
{
    markCommand = folder.wrapMarkCommand([this](std::size_t position) { toggleMark(position); });
    refreshRows(0);
}

void ThreadListView::getText(char *dest, short item, short maxLen)
{
    if (item < 0 || static_cast<std::size_t>(item) >= rows.size())
    {
        *dest = '\0';
        return;
    }

    const auto &row = rows[item];
    const Message *message = listing.messages.messageAt(row.position);
    char markColumn = ' ';
    char stateColumn = ' ';
    if (message)
    {
        if (listing.marks.isMarked(message->id))
            markColumn = '*';
        if (message->isUnread())
            stateColumn = 'N';
    }
    if (row.summary)
        stateColumn = '+';

    std::string text;
    text.push_back(markColumn);
    text.push_back(stateColumn);
    text.push_back(' ');
    text += tfold::core::renderRow(listing.messages, row);
    if (text.size() >= static_cast<std::size_t>(maxLen))
        text.resize(maxLen - 1);
    std::snprintf(dest, maxLen, "%s", text.c_str());
}

void ThreadListView::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown)
    {
        ushort command = commandForKey(event.keyDown.charScan.charCode);
        if (command != 0 && runCommand(command))
        {
            clearEvent(event);
            return;
        }
    }
    else if (event.what == evCommand && runCommand(event.message.command))
    {
        clearEvent(event);
        return;
    }
    TListViewer::handleEvent(event);
}

ushort ThreadListView::commandForKey(char key) noexcept
{
    switch (key)
    {
    case 'f':
        return cmFoldThread;
    case 'u':
        return cmUnfoldThread;
    case 't':
        return cmToggleThread;
    case 'a':
        return cmToggleAndAdvance;
    case 'F':
        return cmFoldAll;
    case 'U':
        return cmUnfoldAll;
    case 'T':
        return cmToggleAll;
    case 'A':
        return cmApplyAll;
    case 'r':
        return cmThreadRoot;
    case 'p':
        return cmPreviousThread;
    case 'n':
        return cmNextThread;
    case 'm':
        return cmMarkMessage;
    case 'M':
        return cmMarkThread;
    case 'o':
        return cmToggleRead;
    default:
        return 0;
    }
}

void ThreadListView::refreshRows(std::optional<std::size_t> focusPosition)
{
    rows = tfold::core::visibleRows(listing.messages, surface);
    setRange(static_cast<short>(std::min<std::size_t>(rows.size(), 0x7FFF)));
    if (focusPosition)
    {
        if (auto index = tfold::core::visibleRowIndex(rows, *focusPosition))
            focusItem(static_cast<short>(*index));
    }
    drawView();
}

std::optional<std::size_t> ThreadListView::currentPosition() const
{
    if (focused < 0 || static_cast<std::size_t>(focused) >= rows.size())
        return std::nullopt;
    return rows[focused].position;
}

bool ThreadListView::runCommand(ushort command)
{
    switch (command)
    {
    case cmFoldThread:
    case cmUnfoldThread:
    case cmToggleThread:
    case cmToggleAndAdvance:
    case cmThreadRoot:
    case cmPreviousThread:
    case cmNextThread:
    case cmMarkMessage:
    case cmMarkThread:
    case cmToggleRead:
    case cmFoldAll:
    case cmUnfoldAll:
    case cmToggleAll:
    case cmApplyAll:
        break;
    default:
        return false;
    }

    const std::size_t position = currentPosition().value_or(0);
    switch (command)
    {
    case cmFoldThread:
        folder.fold(position);
        refreshRows(position);
        break;
    case cmUnfoldThread:
        folder.unfold(position);
        refreshRows(position);
        break;
    case cmToggleThread:
        folder.toggle(position);
        refreshRows(position);
        break;
    case cmToggleAndAdvance:
    {
        auto next = folder.toggleAndAdvance(position);
        refreshRows(next.value_or(folder.threadRoot(position)));
        break;
    }
    case cmFoldAll:
        folder.foldAll();
        refreshRows(folder.threadRoot(position));
        break;
    case cmUnfoldAll:
        folder.unfoldAll();
        refreshRows(position);
        break;
    case cmToggleAll:
        folder.toggleAll();
        refreshRows(folder.threadRoot(position));
        break;
    case cmApplyAll:
        folder.applyAll();
        refreshRows(folder.threadRoot(position));
        break;
    case cmThreadRoot:
        refreshRows(folder.threadRoot(position));
        break;
    case cmPreviousThread:
        if (auto previous = folder.previousThread(position))
            refreshRows(*previous);
        else
            notice("No previous thread");
        break;
    case cmNextThread:
        if (auto next = folder.nextThread(position))
            refreshRows(*next);
        else
            notice("No next thread");
        break;
    case cmMarkMessage:
        markCommand(position);
        drawView();
        break;
    case cmMarkThread:
        markThread(position);
        drawView();
        break;
    case cmToggleRead:
        toggleRead(position);
        drawView();
        break;
    }
    return true;
}

void ThreadListView::toggleMark(std::size_t position)
{
    const Message *message = listing.messages.messageAt(position);
    if (!message)
        return;
    listing.marks.toggle(message->id);
}

void ThreadListView::toggleRead(std::size_t position)
{
    const Message *message = listing.messages.messageAt(position);
    if (!message)
        return;
    // Fold regions keep their extent until the thread is folded again.
    listing.messages.setFlag(position, tfold::core::MessageFlag::Unread, !message->isUnread());
}

void ThreadListView::markThread(std::size_t position)
{
    folder.markThread(position, [this](std::size_t line) {
        if (const Message *message = listing.messages.messageAt(line))
            listing.marks.mark(message->id);
    });
}

void ThreadListView::notice(const std::string &message)
{
    if (noticeCallback)
        noticeCallback(message);
}
