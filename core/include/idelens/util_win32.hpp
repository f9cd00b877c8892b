#pragma once
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include "handle_guard.hpp"
#include "result.hpp"
#include <windows.h>
#include <objbase.h>
#include <cstdint>
#include <string>

namespace idelens {

template <typename T>
class ComPtr {
public:
    ComPtr() : ptr_(nullptr) {}
    ~ComPtr() { if (ptr_) ptr_->Release(); }

    ComPtr(const ComPtr&) = delete;
    ComPtr& operator=(const ComPtr&) = delete;

    T* operator->() const { return ptr_; }
    T** put() {
        if (ptr_) { ptr_->Release(); ptr_ = nullptr; }
        return &ptr_;
    }
    T* get() const { return ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

private:
    T* ptr_;
};

struct CoInitGuard {
    HRESULT hr;
    CoInitGuard(DWORD dwCoInit = COINIT_MULTITHREADED) {
        hr = CoInitializeEx(NULL, dwCoInit);
    }
    ~CoInitGuard() {
        if (SUCCEEDED(hr)) CoUninitialize();
    }
    CoInitGuard(const CoInitGuard&) = delete;
    CoInitGuard& operator=(const CoInitGuard&) = delete;
};

struct KernelHandleTraits {
    using handle_type = HANDLE;
    static HANDLE invalid() { return nullptr; }
    void close(HANDLE h) const { CloseHandle(h); }
};
using SafeHandle = UniqueHandle<KernelHandleTraits>;

// Device context obtained with GetWindowDC / GetDC; ReleaseDC needs the
// window it came from (nullptr for the screen).
struct DeviceContextTraits {
    using handle_type = HDC;
    HWND owner = nullptr;
    static HDC invalid() { return nullptr; }
    void close(HDC h) const { ReleaseDC(owner, h); }
};
using DeviceContextGuard = UniqueHandle<DeviceContextTraits>;

struct BitmapTraits {
    using handle_type = HBITMAP;
    static HBITMAP invalid() { return nullptr; }
    void close(HBITMAP h) const { DeleteObject(h); }
};
using BitmapGuard = UniqueHandle<BitmapTraits>;

struct MemoryDcTraits {
    using handle_type = HDC;
    using object_type = HGDIOBJ;
    static HDC invalid() { return nullptr; }
    static HGDIOBJ invalid_object() { return nullptr; }
    HGDIOBJ select(HDC dc, HGDIOBJ obj) const {
        HGDIOBJ prev = SelectObject(dc, obj);
        return prev == HGDI_ERROR ? nullptr : prev;
    }
    void destroy(HDC dc) const { DeleteDC(dc); }
};
using MemoryDcGuard = ScopedSelectContext<MemoryDcTraits>;

inline Result<DeviceContextGuard> acquire_window_dc(HWND hwnd) {
    HDC dc = GetWindowDC(hwnd);
    if (!dc)
        return make_error(ErrorKind::NotFound, "GetWindowDC", "no device context for window",
                          static_cast<hwnd_u64>(reinterpret_cast<std::uintptr_t>(hwnd)),
                          GetLastError());
    return DeviceContextGuard(dc, DeviceContextTraits{hwnd});
}

inline Result<DeviceContextGuard> acquire_screen_dc() {
    HDC dc = GetDC(nullptr);
    if (!dc)
        return make_error(ErrorKind::NotFound, "GetDC", "no screen device context", 0,
                          GetLastError());
    return DeviceContextGuard(dc, DeviceContextTraits{nullptr});
}

inline Result<MemoryDcGuard> acquire_memory_dc(HDC compatible_with) {
    HDC dc = CreateCompatibleDC(compatible_with);
    if (!dc)
        return make_error(ErrorKind::ResourceExhausted, "CreateCompatibleDC",
                          "cannot create memory device context", 0, GetLastError());
    return MemoryDcGuard(dc);
}

inline Result<BitmapGuard> acquire_bitmap(HDC compatible_with, int width, int height) {
    HBITMAP bmp = CreateCompatibleBitmap(compatible_with, width, height);
    if (!bmp)
        return make_error(ErrorKind::ResourceExhausted, "CreateCompatibleBitmap",
                          "cannot create " + std::to_string(width) + "x" +
                              std::to_string(height) + " bitmap",
                          0, GetLastError());
    return BitmapGuard(bmp);
}

} // namespace idelens
#endif
