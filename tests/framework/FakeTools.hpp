#pragma once

#include "Fixtures.hpp"
#include <string>

namespace reelcast::test {

// Stand-in for the cast control tool. Every invocation is appended to
// <dir>/catt.log; the device's playback state lives in <dir>/device.state.
// Device "Ghost" is unreachable; every device rejects media while
// <dir>/reject-media exists.
inline std::filesystem::path fake_catt(const TempDir& dir) {
    std::string log = (dir.path() / "catt.log").string();
    std::string state = (dir.path() / "device.state").string();
    std::string reject = (dir.path() / "reject-media").string();
    return dir.script("catt",
        "echo \"$*\" >> " + log + "\n"
        "if [ \"$1\" = \"scan\" ]; then\n"
        "  echo 'Scanning Chromecasts...'\n"
        "  echo '192.168.1.50 - Living Room TV - Google Inc. Chromecast'\n"
        "  echo 'Kitchen - 192.168.1.51'\n"
        "  exit 0\n"
        "fi\n"
        "device=\"$2\"\n"
        "verb=\"$3\"\n"
        "if [ \"$device\" = \"Ghost\" ]; then\n"
        "  echo 'Error: Specified device \"Ghost\" not found.' >&2\n"
        "  exit 1\n"
        "fi\n"
        "case \"$verb\" in\n"
        "  cast)\n"
        "    if [ -f " + reject + " ]; then\n"
        "      echo 'Error: The media could not be loaded.' >&2\n"
        "      exit 1\n"
        "    fi\n"
        "    printf 'State: PLAYING\\nDuration: 600.0\\nCurrent time: 12.0\\nVolume: 50\\n' > " + state + " ;;\n"
        "  status)\n"
        "    if [ -f " + state + " ]; then cat " + state + "; else echo 'State: IDLE'; fi ;;\n"
        "  pause) sed -i 's/PLAYING/PAUSED/' " + state + " ;;\n"
        "  play) sed -i 's/PAUSED/PLAYING/' " + state + " ;;\n"
        "  stop) rm -f " + state + " ;;\n"
        "  seek|volume) ;;\n"
        "  *) echo \"Error: unknown command $verb\" >&2; exit 2 ;;\n"
        "esac\n"
        "exit 0");
}

// Stand-in for the transfer client: serves on the port it was given ($3)
// after a short warm-up and stays up until killed
inline std::filesystem::path fake_webtorrent(const TempDir& dir, const std::string& warmup = "0.3") {
    return dir.script("webtorrent",
        "sleep " + warmup + "\n"
        "echo 'Connecting to peers...'\n"
        "echo 'Downloaded: 10 MB/100 MB  Speed: 2.5 MB/s'\n"
        "echo \"Server running at: http://localhost:$3/webtorrent/0123\"\n"
        "exec sleep 30");
}

inline std::string catt_log(const TempDir& dir) {
    return read_file(dir.path() / "catt.log");
}

}  // namespace reelcast::test
