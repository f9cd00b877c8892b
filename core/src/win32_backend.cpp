#include "idelens/win32_backend.hpp"

#ifdef _WIN32
#include "idelens/logger.hpp"
#include "idelens/util_win32.hpp"
#include <psapi.h>
#include <UIAutomation.h>
#include <string>
#include <vector>

namespace idelens {

static hwnd_u64 to_u64(HWND h) {
  return static_cast<hwnd_u64>(reinterpret_cast<std::uintptr_t>(h));
}
static HWND from_u64(hwnd_u64 h) {
  return reinterpret_cast<HWND>(static_cast<std::uintptr_t>(h));
}

static std::string w2u8(const std::wstring &ws) {
  if (ws.empty())
    return {};
  int len = WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), (int)ws.size(), nullptr,
                                0, nullptr, nullptr);
  std::string out(len, '\0');
  WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), (int)ws.size(), out.data(), len,
                      nullptr, nullptr);
  return out;
}

static std::string bstr_to_utf8(BSTR bstr) {
  if (!bstr) return {};
  std::wstring ws(bstr, SysStringLen(bstr));
  return w2u8(ws);
}

static std::wstring get_window_text_w(HWND hwnd) {
  int n = GetWindowTextLengthW(hwnd);
  std::wstring w;
  w.resize((size_t)n + 1);
  int got = GetWindowTextW(hwnd, w.data(), n + 1);
  w.resize((size_t)(got > 0 ? got : 0));
  return w;
}

static std::wstring get_class_name_w(HWND hwnd) {
  wchar_t buf[256];
  int n = GetClassNameW(hwnd, buf, 256);
  return std::wstring(buf, buf + (n > 0 ? n : 0));
}

static BOOL CALLBACK collect_hwnd(HWND h, LPARAM lp) {
  reinterpret_cast<std::vector<hwnd_u64> *>(lp)->push_back(to_u64(h));
  return TRUE;
}

std::vector<hwnd_u64> Win32Backend::list_top() {
  std::vector<hwnd_u64> out;
  EnumWindows(collect_hwnd, reinterpret_cast<LPARAM>(&out));
  return out;
}

std::vector<hwnd_u64> Win32Backend::list_children(hwnd_u64 parent) {
  std::vector<hwnd_u64> all;
  HWND p = from_u64(parent);
  EnumChildWindows(p, collect_hwnd, reinterpret_cast<LPARAM>(&all));

  // EnumChildWindows is recursive; keep direct children only.
  std::vector<hwnd_u64> out;
  for (auto h : all)
    if (GetAncestor(from_u64(h), GA_PARENT) == p)
      out.push_back(h);
  return out;
}

std::optional<WindowInfo> Win32Backend::get_info(hwnd_u64 hwnd_u) {
  HWND hwnd = from_u64(hwnd_u);
  if (!IsWindow(hwnd))
    return std::nullopt;

  WindowInfo wi{};
  wi.hwnd = hwnd_u;
  HWND parent = GetAncestor(hwnd, GA_PARENT);
  if (parent && parent != GetDesktopWindow())
    wi.parent = to_u64(parent);
  wi.class_name = w2u8(get_class_name_w(hwnd));
  wi.title = w2u8(get_window_text_w(hwnd));

  RECT r{};
  if (!GetWindowRect(hwnd, &r)) {
    if (!IsWindow(hwnd))
      return std::nullopt;
    throw std::runtime_error("GetWindowRect failed with error " +
                             std::to_string(GetLastError()));
  }
  wi.window_rect = {r.left, r.top, r.right, r.bottom};

  DWORD pid = 0;
  GetWindowThreadProcessId(hwnd, &pid);
  wi.pid = pid;
  wi.visible = IsWindowVisible(hwnd) != FALSE;
  return wi;
}

hwnd_u64 Win32Backend::foreground_window() {
  return to_u64(GetForegroundWindow());
}

std::uint32_t Win32Backend::current_pid() { return GetCurrentProcessId(); }

Result<std::string> Win32Backend::process_image_name(std::uint32_t pid) {
  SafeHandle h(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
  if (!h) {
    DWORD err = GetLastError();
    if (err == ERROR_ACCESS_DENIED)
      return make_error(ErrorKind::AccessDenied, "OpenProcess",
                        "cannot open process " + std::to_string(pid), 0, err);
    return make_error(ErrorKind::NotFound, "OpenProcess",
                      "no process " + std::to_string(pid), 0, err);
  }

  DWORD code = 0;
  if (GetExitCodeProcess(h.get(), &code) && code != STILL_ACTIVE)
    return make_error(ErrorKind::NotFound, "GetExitCodeProcess",
                      "process " + std::to_string(pid) + " has exited");

  wchar_t buf[32768];
  DWORD sz = (DWORD)(sizeof(buf) / sizeof(buf[0]));
  if (!QueryFullProcessImageNameW(h.get(), 0, buf, &sz)) {
    DWORD err = GetLastError();
    return make_error(err == ERROR_ACCESS_DENIED ? ErrorKind::AccessDenied
                                                 : ErrorKind::NotFound,
                      "QueryFullProcessImageNameW",
                      "no image name for process " + std::to_string(pid), 0,
                      err);
  }
  std::string path = w2u8(std::wstring(buf, buf + sz));
  auto slash = path.find_last_of("\\/");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::uint64_t Win32Backend::process_memory_bytes() {
  PROCESS_MEMORY_COUNTERS pmc{};
  pmc.cb = sizeof(pmc);
  if (!GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc)))
    return 0;
  return pmc.WorkingSetSize;
}

void Win32Backend::relieve_memory_pressure() {
  HeapCompact(GetProcessHeap(), 0);
  if (!SetProcessWorkingSetSize(GetCurrentProcess(), (SIZE_T)-1, (SIZE_T)-1))
    LOG_DEBUG("SetProcessWorkingSetSize failed with error " +
              std::to_string(GetLastError()));
}

// Copies a width x height block at (sx, sy) of `source` into top-down BGRA.
static Result<PixelBuffer> blit(HDC source, int sx, int sy, int width,
                                int height, hwnd_u64 hwnd) {
  auto mem = acquire_memory_dc(source);
  if (!mem)
    return mem.error();
  auto bmp = acquire_bitmap(source, width, height);
  if (!bmp)
    return bmp.error();

  // Declared first so it is deleted last, after mem_dc has put the original
  // bitmap back. A selected bitmap cannot be deleted.
  BitmapGuard bitmap = std::move(bmp).value();
  MemoryDcGuard mem_dc = std::move(mem).value();

  if (!mem_dc.select(bitmap.get()))
    return make_error(ErrorKind::ResourceExhausted, "SelectObject",
                      "cannot select bitmap", hwnd, GetLastError());
  if (!BitBlt(mem_dc.get(), 0, 0, width, height, source, sx, sy,
              SRCCOPY | CAPTUREBLT))
    return make_error(ErrorKind::Malformed, "BitBlt", "block copy failed", hwnd,
                      GetLastError());

  // GetDIBits needs the bitmap deselected.
  mem_dc.reset();

  BITMAPINFO bi{};
  bi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
  bi.bmiHeader.biWidth = width;
  bi.bmiHeader.biHeight = -height; // top-down
  bi.bmiHeader.biPlanes = 1;
  bi.bmiHeader.biBitCount = 32;
  bi.bmiHeader.biCompression = BI_RGB;

  PixelBuffer px;
  px.width = width;
  px.height = height;
  px.bgra.resize((size_t)width * (size_t)height * 4);
  int rows = GetDIBits(source, bitmap.get(), 0, (UINT)height, px.bgra.data(),
                       &bi, DIB_RGB_COLORS);
  if (rows != height)
    return make_error(ErrorKind::Malformed, "GetDIBits",
                      "read " + std::to_string(rows) + " of " +
                          std::to_string(height) + " rows",
                      hwnd, GetLastError());
  return px;
}

Result<PixelBuffer> Win32Backend::grab_window(hwnd_u64 hwnd, int width,
                                              int height) {
  HWND h = from_u64(hwnd);
  if (!IsWindow(h))
    return make_error(ErrorKind::NotFound, "grab_window",
                      "window no longer exists", hwnd);
  auto dc = acquire_window_dc(h);
  if (!dc)
    return dc.error();
  DeviceContextGuard src = std::move(dc).value();
  return blit(src.get(), 0, 0, width, height, hwnd);
}

Result<PixelBuffer> Win32Backend::grab_screen(int x, int y, int width,
                                              int height) {
  auto dc = acquire_screen_dc();
  if (!dc)
    return dc.error();
  DeviceContextGuard src = std::move(dc).value();
  return blit(src.get(), x, y, width, height, 0);
}

static void read_element(IUIAutomationElement *node, UIElementInfo &info) {
  BSTR bStr = NULL;
  if (SUCCEEDED(node->get_CurrentAutomationId(&bStr))) {
    info.automation_id = bstr_to_utf8(bStr);
    SysFreeString(bStr);
  }
  if (SUCCEEDED(node->get_CurrentName(&bStr))) {
    info.name = bstr_to_utf8(bStr);
    SysFreeString(bStr);
  }
  if (SUCCEEDED(node->get_CurrentClassName(&bStr))) {
    info.class_name = bstr_to_utf8(bStr);
    SysFreeString(bStr);
  }
  CONTROLTYPEID cType = 0;
  if (SUCCEEDED(node->get_CurrentControlType(&cType)))
    info.control_type = cType;

  RECT r = {};
  if (SUCCEEDED(node->get_CurrentBoundingRectangle(&r)))
    info.bounding_rect = {r.left, r.top, r.right, r.bottom};

  BOOL bVal = FALSE;
  if (SUCCEEDED(node->get_CurrentIsEnabled(&bVal))) info.enabled = bVal != FALSE;
  if (SUCCEEDED(node->get_CurrentIsOffscreen(&bVal))) info.visible = !bVal;
}

static void read_children(IUIAutomationElement *parent,
                          IUIAutomationCondition *cond, int depth,
                          std::vector<UIElementInfo> &out) {
  ComPtr<IUIAutomationElementArray> children;
  if (FAILED(parent->FindAll(TreeScope_Children, cond, children.put())) ||
      !children)
    return;

  int length = 0;
  children->get_Length(&length);
  for (int i = 0; i < length; i++) {
    ComPtr<IUIAutomationElement> node;
    if (FAILED(children->GetElement(i, node.put())) || !node)
      continue;
    UIElementInfo info;
    read_element(node.get(), info);
    if (depth > 1)
      read_children(node.get(), cond, depth - 1, info.children);
    out.push_back(std::move(info));
  }
}

std::vector<UIElementInfo> Win32Backend::inspect_ui_elements(hwnd_u64 parent) {
  std::vector<UIElementInfo> results;
  HWND hParent = from_u64(parent);
  if (!IsWindow(hParent))
    return results;

  // RPC_E_CHANGED_MODE leaves the thread in its existing apartment, which
  // is still usable.
  CoInitGuard com;

  ComPtr<IUIAutomation> automation;
  HRESULT hr = CoCreateInstance(CLSID_CUIAutomation, NULL, CLSCTX_INPROC_SERVER,
                                IID_IUIAutomation,
                                reinterpret_cast<void **>(automation.put()));
  if (FAILED(hr)) {
    LOG_WARN("UI Automation unavailable, hr=" + std::to_string((long)hr));
    return results;
  }

  ComPtr<IUIAutomationElement> root;
  if (FAILED(automation->ElementFromHandle(hParent, root.put())) || !root)
    return results;

  ComPtr<IUIAutomationCondition> all;
  if (FAILED(automation->CreateTrueCondition(all.put())) || !all)
    return results;

  read_children(root.get(), all.get(), kUiaMaxDepth, results);
  return results;
}

} // namespace idelens
#else
namespace idelens {
std::vector<hwnd_u64> Win32Backend::list_top() { return {}; }
std::vector<hwnd_u64> Win32Backend::list_children(hwnd_u64) { return {}; }
std::optional<WindowInfo> Win32Backend::get_info(hwnd_u64) {
  return std::nullopt;
}
hwnd_u64 Win32Backend::foreground_window() { return 0; }
std::uint32_t Win32Backend::current_pid() { return 0; }
Result<std::string> Win32Backend::process_image_name(std::uint32_t pid) {
  return make_error(ErrorKind::NotFound, "process_image_name",
                    "no window system on this platform (pid " +
                        std::to_string(pid) + ")");
}
std::uint64_t Win32Backend::process_memory_bytes() { return 0; }
void Win32Backend::relieve_memory_pressure() {}
Result<PixelBuffer> Win32Backend::grab_window(hwnd_u64 hwnd, int, int) {
  return make_error(ErrorKind::NotFound, "grab_window",
                    "no window system on this platform", hwnd);
}
Result<PixelBuffer> Win32Backend::grab_screen(int, int, int, int) {
  return make_error(ErrorKind::NotFound, "grab_screen",
                    "no window system on this platform");
}
std::vector<UIElementInfo> Win32Backend::inspect_ui_elements(hwnd_u64) {
  return {};
}
} // namespace idelens
#endif
