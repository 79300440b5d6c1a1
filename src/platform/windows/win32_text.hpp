#pragma once

#include <string>

namespace win32 {

std::wstring widen(const std::string& utf8);
std::string narrow(const wchar_t* wide, int length = -1);

} // namespace win32
