#ifndef FILESHARE_SERVER_INDEX_PAGE_H
#define FILESHARE_SERVER_INDEX_PAGE_H

#include <string>

namespace fileshare {

// Observer page served at "/": live status over /api/events, download or
// upload controls for the session's mode, cancel button and transfer log
const std::string& index_html();

} // namespace fileshare

#endif // FILESHARE_SERVER_INDEX_PAGE_H
