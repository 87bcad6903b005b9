#pragma once

#include "tfold/commands/tfold_browse.hpp"

enum CommandId : unsigned short
{
    cmFoldThread = tfold::commands::browse::FoldThread,
    cmUnfoldThread = tfold::commands::browse::UnfoldThread,
    cmToggleThread = tfold::commands::browse::ToggleThread,
    cmToggleAndAdvance = tfold::commands::browse::ToggleAndAdvance,
    cmFoldAll = tfold::commands::browse::FoldAll,
    cmUnfoldAll = tfold::commands::browse::UnfoldAll,
    cmToggleAll = tfold::commands::browse::ToggleAll,
    cmApplyAll = tfold::commands::browse::ApplyAll,
    cmThreadRoot = tfold::commands::browse::ThreadRoot,
    cmPreviousThread = tfold::commands::browse::PreviousThread,
    cmNextThread = tfold::commands::browse::NextThread,
    cmMarkMessage = tfold::commands::browse::MarkMessage,
    cmMarkThread = tfold::commands::browse::MarkThread,
    cmToggleRead = tfold::commands::browse::ToggleRead,
    cmReloadListing = tfold::commands::browse::ReloadListing,
    cmSaveDefaults = tfold::commands::browse::SaveDefaults,
    cmToggleFoldUnread = tfold::commands::browse::ToggleFoldUnread,
};
