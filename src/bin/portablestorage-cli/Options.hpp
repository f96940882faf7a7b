#ifndef PSCLI_OPTIONS_H_
#define PSCLI_OPTIONS_H_

#include <string>

#include "portablestorage/BaseOptions.hpp"

namespace PortableStorage {
    namespace Filesystem { struct StorageOptions; }
}

namespace PortableStorageCli {

/** Manages command line options and config */
class Options : public PortableStorage::BaseOptions
{
public:

    /** Retrieve the base usage help text string */
    static std::string CoreHelpText();

    /** Retrieve the main command help text string */
    static std::string MainHelpText();

    /** Retrieve the detailed options help text string */
    static std::string DetailHelpText();

    /** @param[out] storageOptions storage root options ref to fill */
    explicit Options(PortableStorage::Filesystem::StorageOptions& storageOptions);

    virtual bool AddFlag(const std::string& flag) override;

    virtual bool AddOption(const std::string& option, const std::string& value) override;

    virtual void Validate() override;

    /** Returns true if commands act on roaming storage instead of local */
    bool isRoaming() const { return mRoaming; }

private:

    PortableStorage::Filesystem::StorageOptions& mStorageOptions;

    bool mRoaming { false };
};

} // namespace PortableStorageCli

#endif // PSCLI_OPTIONS_H_
