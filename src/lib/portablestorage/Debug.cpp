
#include <algorithm>
#include <fstream>
#include <thread>

#include "Debug.hpp"
#include "StringUtil.hpp"

using std::chrono::steady_clock;
using std::chrono::duration;

namespace PortableStorage {

std::mutex Debug::sMutex;
const steady_clock::time_point Debug::sStart { steady_clock::now() };
std::vector<Debug::Sink> Debug::sSinks;
Debug::Level Debug::sLevel { Debug::Level::ERRORS };
std::unordered_set<std::string> Debug::sFilters;
Debug::Level Debug::sMaxLevel { Debug::Level::ERRORS };

namespace { // anonymous

const char* GetLevelName(const Debug::Level level)
{
    switch (level)
    {
        case Debug::Level::ERRORS:   return "error";
        case Debug::Level::PLATFORM: return "platform";
        case Debug::Level::INFO:     return "info";
        case Debug::Level::DETAILS:  return "details";
    }
    return "?";
}

} // anonymous namespace

/*****************************************************/
Debug::Level Debug::GetMaxLevel()
{
    Level retval { sSinks.empty() ? sLevel : Level::ERRORS };
    for (const Sink& sink : sSinks)
        retval = std::max(retval, sink.level);
    return retval;
}

/*****************************************************/
void Debug::SetLevel(Level level)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sLevel = level;
    for (Sink& sink : sSinks)
        sink.level = level;
    sMaxLevel = GetMaxLevel();
}

/*****************************************************/
void Debug::SetFilters(const std::string& filters)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sFilters.clear();
    for (const std::string& prefix : StringUtil::explode(filters,","))
    {
        const std::string trimmed { StringUtil::trim(prefix) };
        if (!trimmed.empty()) sFilters.emplace(trimmed);
    }

    for (Sink& sink : sSinks)
        sink.filters = sFilters; // copy
}

/*****************************************************/
void Debug::AddSink(std::ostream& stream, const std::shared_ptr<std::ostream>& owned)
{
    sSinks.push_back(Sink{ &stream, owned, sLevel, sFilters });
    sMaxLevel = GetMaxLevel();
}

/*****************************************************/
void Debug::AddStream(std::ostream& stream)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);
    AddSink(stream, nullptr);
}

/*****************************************************/
void Debug::AddLogFile(const std::string& path)
{
    const std::shared_ptr<std::ofstream> file { std::make_shared<std::ofstream>() };
    file->exceptions(std::ofstream::failbit | std::ofstream::badbit);
    file->open(path, std::ofstream::out | std::ofstream::app);
    file->exceptions(std::ofstream::goodbit); // never throw while logging

    const std::lock_guard<decltype(sMutex)> lock(sMutex);
    AddSink(*file, file);
}

/*****************************************************/
void Debug::Print(const Debug::StreamFunc& strfunc, Level level)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (const Sink& sink : sSinks)
    {
        if (level > sink.level) continue;
        if (level > Level::ERRORS && !sink.filters.empty() && 
            sink.filters.find(mPrefix) == sink.filters.cend()) continue;

        std::ostream& stream { *sink.stream };

        if (sink.level >= Level::DETAILS)
        {
            const duration<double> time { steady_clock::now() - sStart };
            stream << "[" << GetLevelName(level) << "] "
                   << "tid:" << std::this_thread::get_id() << " "
                   << "time:" << time.count() << " ";

            if (mAddr == nullptr) stream << "static ";
            else stream << "obj:" << mAddr << " ";
        }

        stream << mPrefix << ": "; strfunc(stream); stream << std::endl;
    }
}

} // namespace PortableStorage
