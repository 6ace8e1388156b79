#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>

#define _(String) gettext(String)

#define TWINPANE_TEXT_DOMAIN "net.twinpane.Twinpane"

#define ERR_SOURCE_NOT_FOUND _("Cannot find \"{}\". It may have been moved or deleted.")
#define ERR_DESTINATION_EXISTS _("\"{}\" already exists at the destination.")
#define ERR_PERMISSION_DENIED _("Cannot write to \"{}\": permission denied. Check folder permissions.")
#define ERR_INSUFFICIENT_SPACE _("Not enough space on the destination. Need {}, but only {} available.")
#define ERR_SAME_LOCATION _("\"{}\" is already in this location.")
#define ERR_DESTINATION_INSIDE_SOURCE _("Cannot copy \"{}\" into itself.")
#define ERR_SYMLINK_LOOP _("Symlink loop detected at \"{}\".")
#define ERR_IO_WITH_PATH _("Error with \"{}\": {}")
#define ERR_IO_GENERIC _("An error occurred: {}")
#define ERR_CANCELLED _("Operation was cancelled.")

#endif
