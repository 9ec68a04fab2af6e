// Spawns the tapec executable directly (no shell) and captures its output via a pipe.

#include <array>
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

struct CliResult {
    std::string out;
    int status;
};

static CliResult run_inline(const std::string& code, const std::string& extra = "") {
    std::vector<std::string> args{TAPEC_EXE_PATH, "-e", code};
    std::istringstream iss(extra);
    for (std::string tok; iss >> tok;) args.push_back(tok);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int pipefd[2];
    int rc = pipe(pipefd);
    assert(rc == 0);
    (void)rc;
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }
    close(pipefd[1]);
    std::array<char, 256> buf{};
    std::string out;
    ssize_t n;
    while ((n = read(pipefd[0], buf.data(), buf.size())) > 0) {
        out.append(buf.data(), static_cast<size_t>(n));
    }
    close(pipefd[0]);
    int status;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    return {out, WEXITSTATUS(status)};
}

int main() {
    const std::string helloA = "++++++++[>++++++++<-]>+.";  // prints 'A'
    CliResult r = run_inline(helloA, "-run");
    assert(r.status == 0 && r.out == "A");
    r = run_inline(helloA, "-run -nopt");
    assert(r.status == 0 && r.out == "A");
    r = run_inline(helloA, "-run -cw 32");
    assert(r.status == 0 && r.out == "A");

    r = run_inline(",+.", "-run -in Z");
    assert(r.status == 0 && r.out == "[");

    r = run_inline(helloA);
    assert(r.status == 0);
    assert(r.out.find("int main(void)") != std::string::npos);
    assert(r.out.find("p[1] += p[0] * 8u;") != std::string::npos);

    r = run_inline("+]");
    assert(r.status == 1);
    assert(r.out.find("Unmatched close bracket") != std::string::npos);
    r = run_inline("[+", "-run");
    assert(r.status == 1);
    assert(r.out.find("Unmatched open bracket") != std::string::npos);

    r = run_inline("<", "-run -ts 1");
    assert(r.status == 1);
    r = run_inline("+", "-cw 12");
    assert(r.status == 1);
    r = run_inline("+", "-cw 4");
    assert(r.status == 1);
    assert(r.out.find("Unsupported cell width") != std::string::npos);
    assert(r.out.find("maximum allowed size") == std::string::npos);

    // Forking only exists in the generated C.
    r = run_inline("+Y.", "-run -fork");
    assert(r.status == 0);
    assert(r.out.find("WARNING:") != std::string::npos);
    r = run_inline("+Y.", "-fork");
    assert(r.status == 0);
    assert(r.out.find("fork()") != std::string::npos);
    assert(r.out.find("WARNING:") == std::string::npos);
    return 0;
}
