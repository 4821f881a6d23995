//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Source text of the Go runtime helpers.

#include "codegen/go/RuntimeHelpers.hpp"

namespace shgo::codegen::go
{

const std::vector<RuntimeHelper> &runtimeHelpers()
{
    static const std::vector<RuntimeHelper> kHelpers{
        {"shArg",
         {},
         {},
         R"go(// shArg returns args[n], or "" past the end.
func shArg(args []string, n int) string {
	if n < len(args) {
		return args[n]
	}
	return ""
}
)go"},
        {"shAtoi",
         {"strconv", "strings"},
         {},
         R"go(// shAtoi converts a test operand to an integer; malformed input counts as 0.
func shAtoi(s string) int {
	n, err := strconv.Atoi(strings.TrimSpace(s))
	if err != nil {
		return 0
	}
	return n
}
)go"},
        {"shCommandError",
         {"errors", "fmt", "os/exec"},
         {"shStatus"},
         R"go(// shCommandError maps a process failure to an error carrying its exit status.
func shCommandError(name string, err error) error {
	if err == nil {
		return nil
	}
	var exitErr *exec.ExitError
	if errors.As(err, &exitErr) {
		return fmt.Errorf("%s: %w", name, shStatus(exitErr.ExitCode()))
	}
	if errors.Is(err, exec.ErrNotFound) {
		return fmt.Errorf("%s: command not found: %w", name, shStatus(127))
	}
	return fmt.Errorf("%s: %w", name, err)
}
)go"},
        {"shCopy",
         {"os", "path/filepath"},
         {},
         R"go(// shCopy reads src and writes its bytes to dst (or into dst when it is a directory).
func shCopy(src, dst string) error {
	data, err := os.ReadFile(src)
	if err != nil {
		return err
	}
	if info, err := os.Stat(dst); err == nil && info.IsDir() {
		dst = filepath.Join(dst, filepath.Base(src))
	}
	return os.WriteFile(dst, data, 0o644)
}
)go"},
        {"shExitCode",
         {"errors"},
         {"shStatus"},
         R"go(// shExitCode is the process exit status for a failure.
func shExitCode(err error) int {
	var status shStatus
	if errors.As(err, &status) {
		return int(status)
	}
	return 1
}
)go"},
        {"shGlob",
         {"path/filepath"},
         {},
         R"go(// shGlob expands pattern, keeping it verbatim when nothing matches.
func shGlob(pattern string) []string {
	matches, err := filepath.Glob(pattern)
	if err != nil || len(matches) == 0 {
		return []string{pattern}
	}
	return matches
}
)go"},
        {"shJobGroup",
         {"sync"},
         {},
         R"go(// shJobGroup tracks background jobs and remembers the first failure.
type shJobGroup struct {
	wg    sync.WaitGroup
	mu    sync.Mutex
	first error
}

// Go runs job concurrently.
func (g *shJobGroup) Go(job func() error) {
	g.wg.Add(1)
	go func() {
		defer g.wg.Done()
		if err := job(); err != nil {
			g.mu.Lock()
			if g.first == nil {
				g.first = err
			}
			g.mu.Unlock()
		}
	}()
}

// Wait blocks until every started job has finished.
func (g *shJobGroup) Wait() error {
	g.wg.Wait()
	g.mu.Lock()
	defer g.mu.Unlock()
	err := g.first
	g.first = nil
	return err
}
)go"},
        {"shOutstanding",
         {},
         {"shJobGroup"},
         R"go(// shOutstanding holds the background jobs started by the script.
var shOutstanding shJobGroup
)go"},
        {"shPipeline",
         {"os", "os/exec"},
         {"shCommandError"},
         R"go(// shPipeline starts every stage, connecting each stage's output to the next
// stage's input, then waits for all of them.
func shPipeline(stages ...[]string) error {
	cmds := make([]*exec.Cmd, len(stages))
	for i, argv := range stages {
		cmds[i] = exec.Command(argv[0], argv[1:]...)
		cmds[i].Stderr = os.Stderr
	}
	cmds[0].Stdin = os.Stdin
	cmds[len(cmds)-1].Stdout = os.Stdout

	var pipes []*os.File
	closePipes := func() {
		for _, p := range pipes {
			p.Close()
		}
	}
	for i := 0; i+1 < len(cmds); i++ {
		r, w, err := os.Pipe()
		if err != nil {
			closePipes()
			return err
		}
		cmds[i].Stdout = w
		cmds[i+1].Stdin = r
		pipes = append(pipes, r, w)
	}

	var first error
	started := 0
	for i, cmd := range cmds {
		if err := cmd.Start(); err != nil {
			first = shCommandError(stages[i][0], err)
			break
		}
		started++
	}
	closePipes()
	for i := 0; i < started; i++ {
		if err := cmds[i].Wait(); err != nil && first == nil {
			first = shCommandError(stages[i][0], err)
		}
	}
	return first
}
)go"},
        {"shPrintf",
         {"strconv", "strings"},
         {"shAtoi"},
         R"go(// shPrintf formats like printf(1) for %s, %d, %% and the \n, \t, \\ escapes.
func shPrintf(format string, args ...string) string {
	var b strings.Builder
	next := 0
	arg := func() string {
		if next < len(args) {
			next++
			return args[next-1]
		}
		return ""
	}
	for i := 0; i < len(format); i++ {
		c := format[i]
		switch {
		case c == '\\' && i+1 < len(format):
			i++
			switch format[i] {
			case 'n':
				b.WriteByte('\n')
			case 't':
				b.WriteByte('\t')
			case '\\':
				b.WriteByte('\\')
			default:
				b.WriteByte('\\')
				b.WriteByte(format[i])
			}
		case c == '%' && i+1 < len(format):
			i++
			switch format[i] {
			case 's':
				b.WriteString(arg())
			case 'd':
				b.WriteString(strconv.Itoa(shAtoi(arg())))
			case '%':
				b.WriteByte('%')
			default:
				b.WriteByte('%')
				b.WriteByte(format[i])
			}
		default:
			b.WriteByte(c)
		}
	}
	return b.String()
}
)go"},
        {"shPwd",
         {"fmt", "os"},
         {},
         R"go(// shPwd prints the working directory.
func shPwd() error {
	dir, err := os.Getwd()
	if err != nil {
		return err
	}
	fmt.Println(dir)
	return nil
}
)go"},
        {"shRead",
         {"io", "os", "strings"},
         {"shStatus"},
         R"go(// shRead reads one line from standard input into targets, splitting it on
// whitespace; the last target receives the remaining fields.
func shRead(targets ...*string) error {
	var line []byte
	buf := make([]byte, 1)
	for {
		n, err := os.Stdin.Read(buf)
		if n == 1 && buf[0] != '\n' {
			line = append(line, buf[0])
			continue
		}
		if n == 1 || (err == io.EOF && len(line) > 0) {
			break
		}
		if err == io.EOF {
			return shStatus(1)
		}
		if err != nil {
			return err
		}
	}
	fields := strings.Fields(string(line))
	for i, target := range targets {
		switch {
		case i == len(targets)-1 && i < len(fields):
			*target = strings.Join(fields[i:], " ")
		case i < len(fields):
			*target = fields[i]
		default:
			*target = ""
		}
	}
	return nil
}
)go"},
        {"shRestoreEnv",
         {"os", "strings"},
         {},
         R"go(// shRestoreEnv snapshots the environment and returns a function restoring it.
func shRestoreEnv() func() {
	saved := os.Environ()
	return func() {
		os.Clearenv()
		for _, kv := range saved {
			if i := strings.IndexByte(kv, '='); i > 0 {
				os.Setenv(kv[:i], kv[i+1:])
			}
		}
	}
}
)go"},
        {"shRun",
         {"bytes", "os", "os/exec"},
         {"shCommandError"},
         R"go(// shRun runs an external command, captures its output and prints each
// stream to the current os.Stdout and os.Stderr.
func shRun(name string, args ...string) error {
	var stdout, stderr bytes.Buffer
	cmd := exec.Command(name, args...)
	cmd.Stdin = os.Stdin
	cmd.Stdout = &stdout
	cmd.Stderr = &stderr
	err := cmd.Run()
	os.Stdout.Write(stdout.Bytes())
	os.Stderr.Write(stderr.Bytes())
	return shCommandError(name, err)
}
)go"},
        {"shSaveDir",
         {"os"},
         {},
         R"go(// shSaveDir returns a function that changes back to the current directory.
func shSaveDir() (func(), error) {
	dir, err := os.Getwd()
	if err != nil {
		return nil, err
	}
	return func() { os.Chdir(dir) }, nil
}
)go"},
        {"shStatus",
         {"fmt"},
         {},
         R"go(// shStatus is a failure carrying a shell exit status.
type shStatus int

func (s shStatus) Error() string {
	return fmt.Sprintf("exit status %d", int(s))
}
)go"},
        {"shSwap",
         {"os"},
         {},
         R"go(// shSwap points *slot at f and returns a function restoring the old file.
func shSwap(slot **os.File, f *os.File) func() {
	saved := *slot
	*slot = f
	return func() { *slot = saved }
}
)go"},
        {"shTestFile",
         {"os"},
         {},
         R"go(// shTestFile implements the -e, -f and -d file tests.
func shTestFile(op, path string) bool {
	info, err := os.Stat(path)
	if err != nil {
		return false
	}
	switch op {
	case "-d":
		return info.IsDir()
	case "-f":
		return info.Mode().IsRegular()
	}
	return true
}
)go"},
        {"shUnescape",
         {"strings"},
         {},
         R"go(// shUnescape interprets the backslash escapes accepted by echo -e.
func shUnescape(s string) string {
	var b strings.Builder
	for i := 0; i < len(s); i++ {
		if s[i] != '\\' || i+1 == len(s) {
			b.WriteByte(s[i])
			continue
		}
		i++
		switch s[i] {
		case 'n':
			b.WriteByte('\n')
		case 't':
			b.WriteByte('\t')
		case 'r':
			b.WriteByte('\r')
		case 'a':
			b.WriteByte('\a')
		case 'b':
			b.WriteByte('\b')
		case 'f':
			b.WriteByte('\f')
		case 'v':
			b.WriteByte('\v')
		case 'e':
			b.WriteByte(0x1b)
		case '\\':
			b.WriteByte('\\')
		default:
			b.WriteByte('\\')
			b.WriteByte(s[i])
		}
	}
	return b.String()
}
)go"},
    };
    return kHelpers;
}

const RuntimeHelper *findHelper(std::string_view name)
{
    for (const auto &helper : runtimeHelpers())
    {
        if (helper.name == name)
            return &helper;
    }
    return nullptr;
}

} // namespace shgo::codegen::go
