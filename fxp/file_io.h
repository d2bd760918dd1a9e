// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_4719305826140937265
#define FILE_IO_H_4719305826140937265

#include <optional>
#include <stdexcept>
#include "file_error.h"
    #include <sys/stat.h>


namespace fxp
{
/*  OS-buffered file I/O:
    - sequential read accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const std::string& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath);
};

//--------------------------------------------------------------------

//stream all bytes of a file block-wise: e.g. for hashing without loading the file into memory
template <class Function>
void readFileBlocks(const std::string& filePath, Function onBlock /*(const void* buffer, size_t bytes) throw X*/); //throw FileError, X








//######################## implementation ##########################
template <class Function> inline
void readFileBlocks(const std::string& filePath, Function onBlock) //throw FileError, X
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string buffer(fileIn.getBlockSize(), '\0'); //throw FileError
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //EOF
            break;
        onBlock(buffer.data(), bytesRead); //throw X
    }
    fileIn.close(); //throw FileError
}
}

#endif //FILE_IO_H_4719305826140937265
