#include "EventJson.hpp"

namespace burrow {
json eventToJson(const Event& event) {
  json retval;
  retval["type"] = "event";
  json data;
  switch (event.payload_case()) {
    case Event::kSearchStarted: {
      const SearchStarted& started = event.search_started();
      retval["event"] = "Started";
      data["query"] = started.query();
      data["searchId"] = started.search_id();
      break;
    }
    case Event::kSearchResult: {
      const SearchResult& result = event.search_result();
      retval["event"] = "Result";
      data["searchId"] = result.search_id();
      data["path"] = result.path();
      data["name"] = result.name();
      data["isFile"] = result.is_file();
      data["size"] = result.size();
      data["modified"] = result.modified();
      break;
    }
    case Event::kSearchFinished: {
      const SearchFinished& finished = event.search_finished();
      retval["event"] = "Finished";
      data["searchId"] = finished.search_id();
      data["totalMatches"] = finished.total_matches();
      data["hasMore"] = finished.has_more();
      data["cancelled"] = finished.cancelled();
      break;
    }
    case Event::kPtyOutput: {
      const PtyOutput& output = event.pty_output();
      retval["event"] = "Output";
      data["sessionId"] = output.session_id();
      data["data"] = output.data();
      break;
    }
    case Event::kPtyExit: {
      const PtyExit& ptyExit = event.pty_exit();
      retval["event"] = "Exit";
      data["sessionId"] = ptyExit.session_id();
      data["reason"] = exitReasonName(ptyExit.reason());
      data["exitCode"] = ptyExit.exit_code();
      break;
    }
    default:
      STFATAL << "Event without payload";
  }
  retval["data"] = data;
  return retval;
}

json volumeToJson(const VolumeInfo& volume) {
  json retval;
  retval["name"] = volume.name();
  retval["path"] = volume.path();
  retval["driveType"] = driveTypeName(volume.drive_type());
  retval["totalSpace"] = volume.total_space();
  retval["availableSpace"] = volume.available_space();
  retval["isRemovable"] = volume.is_removable();
  retval["fileSystem"] = volume.file_system();
  return retval;
}

string exitReasonName(PtyExitReason reason) {
  switch (reason) {
    case EXIT_EOF:
      return "eof";
    case EXIT_ERROR:
      return "error";
    case EXIT_DESTROYED:
      return "destroyed";
  }
  return "unknown";
}

string driveTypeName(DriveType driveType) {
  switch (driveType) {
    case DRIVE_FIXED:
      return "Fixed";
    case DRIVE_REMOVABLE:
      return "Removable";
    case DRIVE_NETWORK:
      return "Network";
    case DRIVE_CDROM:
      return "CdRom";
    case DRIVE_UNKNOWN:
      return "Unknown";
  }
  return "Unknown";
}
}  // namespace burrow
