#ifndef LIBPS_DEBUG_H_
#define LIBPS_DEBUG_H_

#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace PortableStorage {

/** 
 * Global thread-safe debug printing
 * Each sink has its own level and prefix filters, 
 * errors are never filtered
 */
class Debug
{
public:

    /** Debug verbosity */
    enum class Level
    {
        /** Only show Error()s */        ERRORS,
        /** Also show platform calls */  PLATFORM,
        /** Adapter operations */        INFO,
        /** Add thread/time/object */    DETAILS,
        LAST = DETAILS
    };

    /** Returns the highest level of all configured sinks */
    static Level GetLevel(){ return sMaxLevel; }

    /** Sets the log level for all sinks (and future ones) - THREAD SAFE */
    static void SetLevel(Level level);

    /** Sets the comma-separated prefix filters for all sinks - THREAD SAFE */
    static void SetFilters(const std::string& filters);

    /** Adds a non-owned output stream to send output to - THREAD SAFE */
    static void AddStream(std::ostream& stream);

    /** 
     * Opens a log file (append) to send output to - THREAD SAFE
     * @throws std::ios_base::failure if the file cannot be opened
     */
    static void AddLogFile(const std::string& path);

    /**
     * Construct a new debug module (simple and static safe!)
     * @param prefix name to use for all prints, also used for filtering
     * @param addr address of the owning object to print with details
     */
    explicit Debug(const std::string& prefix, const void* addr) noexcept :
        mAddr(addr), mPrefix(prefix) { }

    /** Function to send debug text to a given output stream */
    using StreamFunc = std::function<void (std::ostream&)>;

    /** Prints func if the level is >= ERRORS */
    inline void Error(const StreamFunc& strfunc)
    {
        if (sMaxLevel >= Level::ERRORS) Print(strfunc,Level::ERRORS);
    }

    /** Prints func if the level is >= PLATFORM */
    inline void Platform(const StreamFunc& strfunc)
    {
        if (sMaxLevel >= Level::PLATFORM) Print(strfunc,Level::PLATFORM);
    }

    /** Prints func if the level is >= INFO */
    inline void Info(const StreamFunc& strfunc)
    {
        // sMaxLevel is checked before building any output
        if (sMaxLevel >= Level::INFO) Print(strfunc,Level::INFO);
    }

    /** Sends the current function name and strcode to debug (error) */
    #define DBG_ERROR(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Error([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Sends the current function name and strcode to debug (platform) */
    #define DBG_PLATFORM(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Platform([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Sends the current function name and strcode to debug (info) */
    #define DBG_INFO(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Info([&](std::ostream& str){ str << myfname << strcode; }); }

    #define DDBG_ERROR(strfunc) DBG_ERROR(debug, strfunc)
    #define MDBG_ERROR(strfunc) DBG_ERROR(mDebug, strfunc)

    #define DDBG_PLATFORM(strfunc) DBG_PLATFORM(debug, strfunc)
    #define MDBG_PLATFORM(strfunc) DBG_PLATFORM(mDebug, strfunc)

    #define DDBG_INFO(strfunc) DBG_INFO(debug, strfunc)
    #define MDBG_INFO(strfunc) DBG_INFO(mDebug, strfunc)

private:

    /** Prints func to all sinks that accept the given level - THREAD SAFE */
    void Print(const StreamFunc& strfunc, Level level);

    /** The address this debug instance belongs to */
    const void* const mAddr;
    /** The module name this debug instance belongs to */
    const std::string mPrefix;

    /** A destination for debug output */
    struct Sink
    {
        std::ostream* stream;
        /** set if the sink owns its stream (log files) */
        std::shared_ptr<std::ostream> owned;
        Level level;
        std::unordered_set<std::string> filters;
    };

    /** Adds a sink with the current level and filters, requires sMutex */
    static void AddSink(std::ostream& stream, const std::shared_ptr<std::ostream>& owned);

    /** Returns the max level of all sinks, requires sMutex */
    static Level GetMaxLevel();

    static std::mutex sMutex;
    /** timestamp when the program started */
    static const std::chrono::steady_clock::time_point sStart;

    /** Global list of sinks (vector for iteration speed) */
    static std::vector<Sink> sSinks;
    /** The level/filters given to new sinks */
    static Level sLevel;
    static std::unordered_set<std::string> sFilters;

    /** The maximum level of all sinks, checked before any formatting */
    static Level sMaxLevel;
};

} // namespace PortableStorage

#endif // LIBPS_DEBUG_H_
