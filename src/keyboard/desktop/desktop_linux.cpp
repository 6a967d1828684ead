/**
 * @file keyboard/desktop/desktop_linux.cpp
 * @brief Linux desktop: X11 for windows and focus, uinput for key events.
 *
 * Window lookup and activation talk EWMH to the window manager through Xlib.
 * Key events are written to a virtual keyboard created through
 * `/dev/uinput`; evdev codes come from the active XKB layout via xkbcommon.
 * The uinput device is seen by the whole session, which is why the `Sender`
 * focuses the target window before emitting.
 */

#if defined(__linux__)

#include <keycadence/keyboard/desktop.hpp>
#include <keycadence/log.hpp>

#include "keyboard/common/linux_keysym.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <linux/uinput.h>
#include <mutex>
#include <string>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>
#include <xkbcommon/xkbcommon.h>

namespace keycadence::keyboard {

namespace {

// Windows can disappear between listing and querying them; such errors are
// expected and only logged.
int ignoreXError(Display *display, XErrorEvent *ev) {
  char text[128] = {0};
  XGetErrorText(display, ev->error_code, text, sizeof(text) - 1);
  KEYCADENCE_LOG_DEBUG("LinuxDesktop: X error ignored: %s (request %u)", text,
                       static_cast<unsigned>(ev->request_code));
  return 0;
}

/**
 * @internal
 * @brief RAII owner of data returned by XGetWindowProperty.
 */
struct XProperty {
  unsigned char *data{nullptr};
  unsigned long count{0};
  int format{0};
  Atom type{None};

  XProperty() = default;
  XProperty(const XProperty &) = delete;
  XProperty &operator=(const XProperty &) = delete;
  ~XProperty() {
    if (data)
      XFree(data);
  }

  bool read(Display *display, Window w, Atom prop, Atom reqType) {
    unsigned long bytesAfter = 0;
    if (XGetWindowProperty(display, w, prop, 0, ~0L, False, reqType, &type,
                           &format, &count, &bytesAfter, &data) != Success)
      return false;
    return data != nullptr && count > 0;
  }
};

} // namespace

/**
 * @internal
 * @brief X11 + uinput implementation of Desktop.
 */
class LinuxDesktop final : public Desktop {
public:
  LinuxDesktop() {
    initDisplay();
    initUinput();
    initKeyMap();
    KEYCADENCE_LOG_INFO("LinuxDesktop: display=%s uinput fd=%d keys=%zu",
                        m_display ? "open" : "unavailable", m_fd,
                        m_keyMap.size());
  }

  ~LinuxDesktop() override {
    if (m_fd >= 0) {
      ioctl(m_fd, UI_DEV_DESTROY);
      close(m_fd);
      KEYCADENCE_LOG_INFO("LinuxDesktop: uinput device destroyed (fd=%d)",
                          m_fd);
    }
    if (m_display)
      XCloseDisplay(m_display);
  }

  LinuxDesktop(const LinuxDesktop &) = delete;
  LinuxDesktop &operator=(const LinuxDesktop &) = delete;

  bool isReady() const override { return m_display != nullptr && m_fd >= 0; }

  std::optional<WindowHandle> findWindowForProcess(uint32_t pid) override {
    std::lock_guard<std::mutex> lock(m_xMutex);
    if (!m_display)
      return std::nullopt;

    for (Window w : topLevelWindows()) {
      if (windowPid(w) != pid)
        continue;
      if (!isCandidate(w))
        continue;
      KEYCADENCE_LOG_DEBUG("LinuxDesktop: pid %u owns window 0x%lx", pid, w);
      return WindowHandle{static_cast<uint64_t>(w), pid};
    }
    return std::nullopt;
  }

  std::optional<uint64_t> foregroundWindow() override {
    std::lock_guard<std::mutex> lock(m_xMutex);
    if (!m_display)
      return std::nullopt;

    XProperty prop;
    if (prop.read(m_display, DefaultRootWindow(m_display), m_atomActiveWindow,
                  XA_WINDOW)) {
      const Window w = reinterpret_cast<Window *>(prop.data)[0];
      if (w != None)
        return static_cast<uint64_t>(w);
    }

    Window focus = None;
    int revert = 0;
    XGetInputFocus(m_display, &focus, &revert);
    if (focus == None || focus == PointerRoot)
      return std::nullopt;
    return static_cast<uint64_t>(focus);
  }

  bool activate(uint64_t windowId) override {
    std::lock_guard<std::mutex> lock(m_xMutex);
    if (!m_display)
      return false;

    const Window w = static_cast<Window>(windowId);
    const Window root = DefaultRootWindow(m_display);

    if (isHidden(w))
      XMapRaised(m_display, w);

    XEvent event{};
    event.xclient.type = ClientMessage;
    event.xclient.window = w;
    event.xclient.message_type = m_atomActiveWindow;
    event.xclient.format = 32;
    event.xclient.data.l[0] = 2; // source: pager
    event.xclient.data.l[1] = CurrentTime;

    const Status sent =
        XSendEvent(m_display, root, False,
                   SubstructureRedirectMask | SubstructureNotifyMask, &event);
    XRaiseWindow(m_display, w);

    XWindowAttributes attrs{};
    if (XGetWindowAttributes(m_display, w, &attrs) &&
        attrs.map_state == IsViewable) {
      XSetInputFocus(m_display, w, RevertToParent, CurrentTime);
    }
    XFlush(m_display);

    if (!sent) {
      KEYCADENCE_LOG_WARN("LinuxDesktop: activation request for 0x%lx failed",
                          w);
      return false;
    }
    return true;
  }

  bool emit(const std::vector<KeyEvent> &batch) override {
    if (m_fd < 0 || batch.empty())
      return false;

    std::vector<struct input_event> events;
    events.reserve(batch.size() + 1);
    for (const KeyEvent &ke : batch) {
      auto it = m_keyMap.find(ke.key);
      if (it == m_keyMap.end()) {
        KEYCADENCE_LOG_ERROR("LinuxDesktop: no evdev code for key=%s",
                             keyToString(ke.key).c_str());
        return false;
      }
      struct input_event ev{};
      ev.type = EV_KEY;
      ev.code = static_cast<unsigned short>(it->second);
      ev.value = ke.down ? 1 : 0;
      events.push_back(ev);
    }
    struct input_event syn{};
    syn.type = EV_SYN;
    syn.code = SYN_REPORT;
    events.push_back(syn);

    const size_t bytes = events.size() * sizeof(struct input_event);
    std::lock_guard<std::mutex> lock(m_writeMutex);
    const ssize_t written = write(m_fd, events.data(), bytes);
    if (written < 0 || static_cast<size_t>(written) != bytes) {
      KEYCADENCE_LOG_ERROR("LinuxDesktop: write() of %zu events failed: %s",
                           events.size(),
                           written < 0 ? strerror(errno) : "short write");
      return false;
    }
    return true;
  }

private:
  void initDisplay() {
    XInitThreads();
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
      KEYCADENCE_LOG_ERROR("LinuxDesktop: cannot open X display (DISPLAY=%s)",
                           std::getenv("DISPLAY") ? std::getenv("DISPLAY")
                                                  : "<unset>");
      return;
    }
    XSetErrorHandler(ignoreXError);
    m_atomPid = XInternAtom(m_display, "_NET_WM_PID", False);
    m_atomClientList = XInternAtom(m_display, "_NET_CLIENT_LIST", False);
    m_atomActiveWindow = XInternAtom(m_display, "_NET_ACTIVE_WINDOW", False);
    m_atomWmName = XInternAtom(m_display, "_NET_WM_NAME", False);
    m_atomUtf8 = XInternAtom(m_display, "UTF8_STRING", False);
    m_atomWmState = XInternAtom(m_display, "_NET_WM_STATE", False);
    m_atomHidden = XInternAtom(m_display, "_NET_WM_STATE_HIDDEN", False);
  }

  void initUinput() {
    m_fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
    if (m_fd < 0) {
      KEYCADENCE_LOG_ERROR("LinuxDesktop: failed to open /dev/uinput: %s",
                           strerror(errno));
      return;
    }

    bool ok = ioctl(m_fd, UI_SET_EVBIT, EV_KEY) >= 0;
    for (int i = 0; i < KEY_MAX && ok; ++i)
      ok = ioctl(m_fd, UI_SET_KEYBIT, i) >= 0;

    struct uinput_setup usetup{};
    usetup.id.bustype = BUS_USB;
    usetup.id.vendor = 0x1234;
    usetup.id.product = 0x5679;
    std::strncpy(usetup.name, "keycadence virtual keyboard",
                 UINPUT_MAX_NAME_SIZE - 1);

    ok = ok && ioctl(m_fd, UI_DEV_SETUP, &usetup) >= 0 &&
         ioctl(m_fd, UI_DEV_CREATE) >= 0;
    if (!ok) {
      KEYCADENCE_LOG_ERROR("LinuxDesktop: uinput device setup failed: %s",
                           strerror(errno));
      close(m_fd);
      m_fd = -1;
      return;
    }

    // Give the input stack time to pick the new device up.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  void initKeyMap() {
    struct xkb_context *ctx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    struct xkb_keymap *keymap = nullptr;
    struct xkb_state *state = nullptr;

    if (ctx) {
      const auto detected = detail::detectXkbRuleNames();
      struct xkb_rule_names names = {nullptr, nullptr, nullptr, nullptr,
                                     nullptr};
      auto use = [](const std::string &s) {
        return s.empty() ? nullptr : s.c_str();
      };
      names.rules = use(detected.rules);
      names.model = use(detected.model);
      names.layout = use(detected.layout);
      names.variant = use(detected.variant);
      names.options = use(detected.options);
      if (!detected.layout.empty()) {
        KEYCADENCE_LOG_INFO("LinuxDesktop: xkb layout=%s variant=%s",
                            detected.layout.c_str(), detected.variant.c_str());
      }

      keymap = xkb_keymap_new_from_names(
          ctx, detected.empty() ? nullptr : &names, XKB_KEYMAP_COMPILE_NO_FLAGS);
      if (keymap)
        state = xkb_state_new(keymap);
      else
        KEYCADENCE_LOG_WARN("LinuxDesktop: xkb keymap compile failed; using "
                            "fixed evdev codes");
    } else {
      KEYCADENCE_LOG_WARN("LinuxDesktop: xkb_context_new() failed");
    }

    m_keyMap = detail::initLinuxKeyMap(keymap, state).keyToEvdev;

    if (state)
      xkb_state_unref(state);
    if (keymap)
      xkb_keymap_unref(keymap);
    if (ctx)
      xkb_context_unref(ctx);
  }

  std::vector<Window> topLevelWindows() {
    std::vector<Window> out;
    const Window root = DefaultRootWindow(m_display);

    XProperty prop;
    if (prop.read(m_display, root, m_atomClientList, XA_WINDOW)) {
      auto *list = reinterpret_cast<Window *>(prop.data);
      out.assign(list, list + prop.count);
      return out;
    }

    // No EWMH window manager: walk the root's children.
    Window rootRet = None;
    Window parentRet = None;
    Window *children = nullptr;
    unsigned int n = 0;
    if (XQueryTree(m_display, root, &rootRet, &parentRet, &children, &n)) {
      out.assign(children, children + n);
      if (children)
        XFree(children);
    }
    return out;
  }

  uint32_t windowPid(Window w) {
    XProperty prop;
    if (!prop.read(m_display, w, m_atomPid, XA_CARDINAL))
      return 0;
    return static_cast<uint32_t>(reinterpret_cast<unsigned long *>(prop.data)[0]);
  }

  bool isHidden(Window w) {
    XProperty prop;
    if (!prop.read(m_display, w, m_atomWmState, XA_ATOM))
      return false;
    auto *atoms = reinterpret_cast<Atom *>(prop.data);
    for (unsigned long i = 0; i < prop.count; ++i) {
      if (atoms[i] == m_atomHidden)
        return true;
    }
    return false;
  }

  std::string windowTitle(Window w) {
    {
      XProperty prop;
      if (prop.read(m_display, w, m_atomWmName, m_atomUtf8))
        return std::string(reinterpret_cast<char *>(prop.data), prop.count);
    }
    char *name = nullptr;
    std::string title;
    if (XFetchName(m_display, w, &name) && name) {
      title = name;
      XFree(name);
    }
    return title;
  }

  // Visible (mapped or minimized by the WM) and titled.
  bool isCandidate(Window w) {
    XWindowAttributes attrs{};
    if (!XGetWindowAttributes(m_display, w, &attrs))
      return false;
    if (attrs.map_state != IsViewable && !isHidden(w))
      return false;
    return !windowTitle(w).empty();
  }

  Display *m_display{nullptr};
  int m_fd{-1};
  std::unordered_map<Key, int> m_keyMap;
  std::mutex m_xMutex;
  std::mutex m_writeMutex;

  Atom m_atomPid{None};
  Atom m_atomClientList{None};
  Atom m_atomActiveWindow{None};
  Atom m_atomWmName{None};
  Atom m_atomUtf8{None};
  Atom m_atomWmState{None};
  Atom m_atomHidden{None};
};

std::unique_ptr<Desktop> makePlatformDesktop() {
  return std::make_unique<LinuxDesktop>();
}

} // namespace keycadence::keyboard

#endif // __linux__
