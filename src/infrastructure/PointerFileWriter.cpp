#include "infrastructure/PointerFileWriter.hpp"
#include <sstream>
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::infrastructure {

std::string PointerFileWriter::Render(const std::string& link, const std::string& packageName, const std::string& updatedAt) {
    std::stringstream ss;
    ss << "Download the necessary file(s) from the following link:\n\n";
    ss << link << "\n\n";
    ss << "Instructions:\n";
    ss << "1. Download the .unitypackage file from the above link.\n";
    ss << "2. Open Unity and go to Assets > Import Package > Custom Package.\n";
    ss << "3. Select the downloaded .unitypackage file and import it into your project.\n\n";
    ss << "Package: " << packageName << "\n";
    ss << "Last Updated: " << updatedAt << "\n";
    ss << "Synced with BundleSync\n";
    return ss.str();
}

bool PointerFileWriter::Rewrite(const std::filesystem::path& pointerFile,
                                const std::string& link,
                                const std::string& packageName,
                                std::string& error) {
    return AtomicFileWriter::Write(pointerFile, Render(link, packageName, Timestamps::NowHuman()), error);
}

} // namespace bundlesync::infrastructure
